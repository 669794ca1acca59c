// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint.h"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <optional>
#include <set>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include "dataloader.h"
#include "runtime/optimizers/momentum_store.h"
#include "runtime/optimizers/muon.h"
#include "training/model.h"
#include "utilities/comm.h"
#include "utilities/safetensors.h"
#include "utilities/tensor.h"
#include "utilities/utils.h"

namespace {

nlohmann::json read_checkpoint_meta(const std::string& path) {
    const std::string meta_file = path + "/checkpoint.json";
    std::ifstream file(meta_file);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("No checkpoint metadata at {}", meta_file));
    }
    return nlohmann::json::parse(file);
}

//! Step number encoded in a checkpoint directory name, or nullopt for anything else.
std::optional<int> parse_step_dir(std::string_view name) {
    constexpr std::string_view prefix = "step_";
    if (!name.starts_with(prefix)) {
        return std::nullopt;
    }
    name.remove_prefix(prefix.size());
    int step = 0;
    auto [end, ec] = std::from_chars(name.data(), name.data() + name.size(), step);
    if (ec != std::errc{} || end != name.data() + name.size()) {
        return std::nullopt;
    }
    return step;
}

//! Sorted paths of the `momentum.rank_*.safetensors` files in @p directory.
std::vector<std::string> list_momentum_files(const std::string& directory) {
    std::vector<std::string> files;
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        const std::string name = entry.path().filename().string();
        if (name.starts_with("momentum.rank_") && name.ends_with(".safetensors")) {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

std::string get_checkpoint_path(std::string checkpoint_directory, int step) {
    return fmt::format("{}/step_{:08}", checkpoint_directory, step);
}

void save_momentum(const std::string& directory, optimizers::Muon& muon, int rank) {
    write_safetensors(directory + fmt::format("/momentum.rank_{:03}.safetensors", rank), muon.momentum());
}

int remove_momentum_files(const std::string& directory) {
    int removed = 0;
    for (const auto& file : list_momentum_files(directory)) {
        removed += std::filesystem::remove(file) ? 1 : 0;
    }
    return removed;
}

/**
 * @brief Restore momentum buffers from every `momentum.rank_*.safetensors` file in @p directory.
 *
 * Each file holds the buffers of the parameters its rank owned when it was written. Buffers are
 * keyed by parameter name, so a checkpoint written with a different number of ranks is simply
 * redistributed according to the current ownership.
 *
 * @throws std::runtime_error If a file names a parameter the optimizer does not know about,
 *         a parameter appears in more than one file, or a buffer's shape disagrees with its parameter.
 */
int load_momentum(const std::string& directory, optimizers::Muon& muon, cudaStream_t stream) {
    std::set<std::string> known;
    for (const auto& spec : muon.parameters()) {
        known.insert(spec.Name);
    }

    int restored = 0;
    std::map<std::string, std::string> source_of;
    for (const auto& file : list_momentum_files(directory)) {
        SafeTensorsReader reader(file);
        for (const auto& entry : reader.entries()) {
            if (!known.contains(entry.name())) {
                throw std::runtime_error(fmt::format("Momentum file {} contains unknown parameter `{}`", file, entry.name()));
            }
            if (auto [it, inserted] = source_of.emplace(entry.name(), file); !inserted) {
                throw std::runtime_error(fmt::format("Momentum of `{}` is stored in both {} and {}",
                                                     entry.name(), it->second, file));
            }
            if (!muon.owns(entry.name())) {
                continue;
            }
            Tensor& buffer = muon.momentum().get_or_create(entry.name(), entry.shape(), stream);
            // the zero-fill has to land before the upload
            CUDA_CHECK(cudaStreamSynchronize(stream));
            entry.read_tensor(buffer);
            ++restored;
        }
    }
    return restored;
}

/**
 * @brief Save a checkpoint (weights + optimizer state) at @p step.
 *
 * Rank 0 writes the replicated parameters and AdamW moments; every rank writes the momentum
 * buffers it owns. Rank 0 writes `checkpoint.json` after all ranks have finished.
 *
 * @param target Base checkpoint directory (the step subdirectory is appended).
 * @param step Training step number used to name the checkpoint directory.
 * @param model Model providing weights and optimizer state.
 * @param loader Optional dataloader whose iteration state is persisted; may be null.
 * @param comm NCCL communicator used for rank/world information and barriers.
 * @param run_name Recorded in the metadata.
 * @return The full path to the created checkpoint directory for @p step.
 *
 * @throws std::filesystem::filesystem_error If directory creation or file operations fail.
 */
std::string save_checkpoint(std::string target, int step, ResidualMLPModel& model, const DataLoader* loader,
                            NCCLCommunicator& comm, const std::string& run_name) {
    CUDA_CHECK(cudaStreamSynchronize(model.stream()));
    comm.barrier();

    target = get_checkpoint_path(std::move(target), step);
    if (comm.rank() == 0) {
        std::filesystem::create_directories(target);
        // a previous save of this step may have used more ranks
        std::filesystem::remove(target + "/checkpoint.json");
        remove_momentum_files(target);
    }
    comm.barrier();

    write_safetensors(target + "/model.safetensors", model.weights(), comm);
    save_momentum(target, model.muon(), comm.rank());
    if (comm.rank() == 0) {
        write_safetensors(target + "/adam.safetensors", model.adam_state());
    }

    comm.barrier();  // only write checkpoint.json once we know all the files are saved

    if (comm.rank() == 0) {
        nlohmann::json meta_data;
        if(loader) {
            meta_data["data-loader"] = nlohmann::json::object({
                  {"epoch",       loader->epoch()},
                  {"file_index",  loader->file_index()},
                  {"position",    loader->position()}
            });
        }

        meta_data["run"] = nlohmann::json::object({
            {"step", step},
            {"name", run_name},
            {"adam_steps", model.adam_steps()},
        });

        meta_data["distributed"] = nlohmann::json::object({
            {"world", comm.world_size()},
        });

        const std::string meta_file = target + "/checkpoint.json";
        {
            std::ofstream file(meta_file + ".tmp");
            file << std::setw(2) << meta_data;
            if (!file) {
                throw std::runtime_error(fmt::format("Could not write {}", meta_file));
            }
        }
        std::filesystem::rename(meta_file + ".tmp", meta_file);
    }

    comm.barrier();
    return target;
}

/**
 * @brief Load a checkpoint written by save_checkpoint().
 *
 * Weights and AdamW moments are replicated and read by every rank. Momentum buffers are
 * redistributed according to the current ownership, so the world size may change between runs.
 *
 * @throws std::runtime_error If the checkpoint directory or checkpoint.json does not exist,
 *         or if checkpoint.json cannot be opened/parsed.
 */
void load_checkpoint(std::string source, int step, ResidualMLPModel& model, DataLoader* loader, NCCLCommunicator& comm) {
    comm.barrier();
    source = get_checkpoint_path(std::move(source), step);
    nlohmann::json meta_data = read_checkpoint_meta(source);

    if (loader) {
        const auto& dl = meta_data.at("data-loader");
        loader->set_state(dl.at("epoch").get<int>(), dl.at("file_index").get<int>(), dl.at("position").get<std::int64_t>());
    }
    model.set_adam_steps(meta_data.at("run").at("adam_steps").get<int>());

    load_safetensors(source + "/model.safetensors", model.weights());
    load_safetensors(source + "/adam.safetensors", model.adam_state());
    load_momentum(source, model.muon(), model.stream());

    comm.barrier();
}

int get_checkpoint_world_size(std::string checkpoint_directory, int step) {
    const auto meta_data = read_checkpoint_meta(get_checkpoint_path(std::move(checkpoint_directory), step));
    return meta_data.at("distributed").at("world").get<int>();
}

/**
 * @brief Steps of all checkpoint directories below @p checkpoint_directory, in no particular order.
 *
 * Only `step_<n>` directories with n > 0 count; a missing directory yields an empty list.
 */
std::vector<int> get_all_checkpoints(const std::string& checkpoint_directory) {
    std::vector<int> checkpoints;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(checkpoint_directory, ec)) {
        if (!entry.is_directory()) {
            continue;
        }
        if (auto step = parse_step_dir(entry.path().filename().string()); step && *step > 0) {
            checkpoints.push_back(*step);
        }
    }
    return checkpoints;
}

int find_latest_checkpoint(const std::string& checkpoint_directory) {
    const auto checkpoints = get_all_checkpoints(checkpoint_directory);
    return checkpoints.empty() ? -1 : *std::max_element(checkpoints.begin(), checkpoints.end());
}

//! Returns the removed directories, oldest first.
std::vector<std::string> clean_old_checkpoints(const std::string& checkpoint_directory, int n_to_keep) {
    auto checkpoints = get_all_checkpoints(checkpoint_directory);
    std::sort(checkpoints.begin(), checkpoints.end());

    std::vector<std::string> removed;
    const int excess = static_cast<int>(checkpoints.size()) - std::max(n_to_keep, 0);
    for (int i = 0; i < excess; ++i) {
        removed.push_back(get_checkpoint_path(checkpoint_directory, checkpoints[i]));
        std::filesystem::remove_all(removed.back());
    }
    return removed;
}
