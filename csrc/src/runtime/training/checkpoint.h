// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_RUNTIME_TRAINING_CHECKPOINT_H
#define SPECTRON_SRC_RUNTIME_TRAINING_CHECKPOINT_H

#include <string>
#include <vector>

#include <cuda_runtime.h>

class DataLoader;
class NCCLCommunicator;
class ResidualMLPModel;

namespace optimizers { class Muon; }

//! Constructs full path for checkpoint at given step
std::string get_checkpoint_path(std::string checkpoint_directory, int step);

//! Saves weights, optimizer state and training metadata
std::string save_checkpoint(std::string checkpoint_directory, int step, ResidualMLPModel& model,
                            const DataLoader* loader, NCCLCommunicator& comm, const std::string& run_name = "");

//! Restores model and training state from checkpoint. The world size may differ from the one
//! the checkpoint was written with.
void load_checkpoint(std::string checkpoint_directory, int step, ResidualMLPModel& model,
                     DataLoader* loader, NCCLCommunicator& comm);

//! Writes the momentum buffers held by this rank to `momentum.rank_XXX.safetensors` in @p directory.
void save_momentum(const std::string& directory, optimizers::Muon& muon, int rank);

//! Deletes every momentum file in @p directory; returns how many were removed.
int remove_momentum_files(const std::string& directory);

//! Reads all momentum files in @p directory and keeps the buffers of parameters this rank owns.
//! Returns the number of buffers restored.
int load_momentum(const std::string& directory, optimizers::Muon& muon, cudaStream_t stream);

//! Gets the world size for which a checkpoint was created
int get_checkpoint_world_size(std::string checkpoint_directory, int step);

//! Lists available checkpoint step numbers.
std::vector<int> get_all_checkpoints(const std::string& checkpoint_directory);

//! Returns latest checkpoint step number, -1 if none exist
int find_latest_checkpoint(const std::string& checkpoint_directory);

//! Removes old checkpoints while preserving the latest `n_to_keep`.
std::vector<std::string> clean_old_checkpoints(const std::string& checkpoint_directory, int n_to_keep);

#endif //SPECTRON_SRC_RUNTIME_TRAINING_CHECKPOINT_H
