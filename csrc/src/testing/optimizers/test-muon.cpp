// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests of the Muon step: round-robin planning, the compute/apply/gather ordering, and
// equivalence of a two-rank run (two threads sharing one device) with a single-rank run.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <exception>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <cuda_runtime.h>
#include <fmt/core.h>

#include "runtime/optimizers/errors.h"
#include "runtime/optimizers/muon.h"
#include "utilities/allocator.h"
#include "utilities/comm.h"
#include "utilities/utils.h"
#include "utilities/test_collective.h"
#include "utilities/test_utils.h"

using namespace testing_utils;
using namespace optimizers;

namespace {

//! Records the step state machine as "GATHER(g,i)" / "APPLIED(g,i)" strings.
class RecordingObserver : public MuonObserver {
public:
    void on_gather_issued(std::size_t group, long shard) override {
        Events.push_back(fmt::format("GATHER({},{})", group, shard));
    }
    void on_applied(std::size_t group, long shard) override {
        Events.push_back(fmt::format("APPLIED({},{})", group, shard));
    }

    std::vector<std::string> Events;
};

struct HostProblem {
    std::vector<std::string> Names;
    std::vector<long> Rows;
    std::vector<long> Cols;
    std::vector<std::vector<float>> Params;
    std::vector<std::vector<float>> Grads;
};

HostProblem make_problem(const std::vector<std::pair<long, long>>& shapes, std::uint64_t seed) {
    HostProblem p;
    for (std::size_t i = 0; i < shapes.size(); ++i) {
        p.Names.push_back(fmt::format("p{}", i));
        p.Rows.push_back(shapes[i].first);
        p.Cols.push_back(shapes[i].second);
        std::vector<float> w(shapes[i].first * shapes[i].second);
        std::vector<float> g(w.size());
        fill_normal(w, 0.f, 0.1f, seed + 2 * i);
        fill_normal(g, 0.f, 1.f, seed + 2 * i + 1);
        p.Params.push_back(std::move(w));
        p.Grads.push_back(std::move(g));
    }
    return p;
}

//! One rank's view of a problem: device copies of the parameters and gradients.
struct RankState {
    TensorAllocator Alloc;
    cudaStream_t Stream = nullptr;
    std::vector<ParameterSpec> Specs;
    std::map<std::string, Tensor> Grads;

    explicit RankState(const HostProblem& p) {
        CUDA_CHECK(cudaStreamCreate(&Stream));
        for (std::size_t i = 0; i < p.Names.size(); ++i) {
            Tensor w = to_device(Alloc, "param", p.Params[i], {p.Rows[i], p.Cols[i]});
            Specs.push_back(ParameterSpec{p.Names[i], w, 0});
            Grads[p.Names[i]] = Alloc.allocate(ETensorDType::FP32, "grad", {p.Rows[i], p.Cols[i]});
        }
    }
    ~RankState() {
        cudaStreamDestroy(Stream);
    }

    void upload_grads(const HostProblem& p) {
        for (std::size_t i = 0; i < p.Names.size(); ++i) {
            Tensor& g = Grads.at(p.Names[i]);
            CUDA_CHECK(cudaMemcpy(g.Data, p.Grads[i].data(), g.bytes(), cudaMemcpyHostToDevice));
        }
    }

    Muon::GradientLookup lookup() {
        return [this](const ParameterSpec& spec) -> Tensor* {
            auto found = Grads.find(spec.Name);
            return found == Grads.end() ? nullptr : &found->second;
        };
    }
};

//! Runs @p steps Muon steps on @p world threads; returns the final parameters of every rank.
std::vector<std::vector<std::vector<float>>> run_ranks(const HostProblem& p, int world, int steps,
                                                        std::vector<std::vector<std::string>>* events = nullptr) {
    LoopbackExchange exchange(world);
    std::vector<std::vector<std::vector<float>>> result(world);
    std::vector<std::exception_ptr> errors(world);
    if (events) {
        events->resize(world);
    }

    auto work = [&](int rank) {
        try {
            CUDA_CHECK(cudaSetDevice(0));
            RankState state(p);
            LoopbackCollective comm(rank, exchange);
            RecordingObserver observer;
            std::vector<HyperParameters> hyper = {HyperParameters{0.02f, true, 8.0f}};
            Muon muon(state.Specs, hyper, comm, state.Alloc, state.Stream);
            muon.set_observer(&observer);

            for (int step = 0; step < steps; ++step) {
                state.upload_grads(p);
                muon.step(StepParameters{1.0f, 0.9f, step}, state.lookup());
            }
            CUDA_CHECK(cudaStreamSynchronize(state.Stream));

            for (const auto& spec : state.Specs) {
                result[rank].push_back(from_device<float>(spec.Param));
            }
            if (events) {
                (*events)[rank] = observer.Events;
            }
        } catch (...) {
            errors[rank] = std::current_exception();
            // peers would otherwise block in the exchange forever
            exchange.Barrier.arrive_and_drop();
        }
    };

    std::vector<std::thread> threads;
    for (int r = 0; r < world; ++r) {
        threads.emplace_back(work, r);
    }
    for (auto& t : threads) {
        t.join();
    }
    for (auto& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
    return result;
}

} // namespace

TEST_CASE("round-robin plan covers every parameter exactly once", "[optimizers][muon]") {
    for (int world : {1, 2, 3, 8}) {
        for (long n : {0L, 1L, 2L, 3L, 7L, 8L, 17L}) {
            auto plan = plan_shards(n, world);
            std::multiset<long> seen;
            for (const auto& slot : plan) {
                REQUIRE(slot.Base % world == 0);
                REQUIRE(slot.Rank >= 0);
                REQUIRE(slot.Rank < world);
                if (slot.Parameter >= 0) {
                    REQUIRE(slot.Parameter == slot.Base + slot.Rank);
                    seen.insert(slot.Parameter);
                }
            }
            REQUIRE(seen.size() == static_cast<std::size_t>(n));
            for (long i = 0; i < n; ++i) {
                REQUIRE(seen.count(i) == 1);
            }
            // every shard has one slot per rank
            REQUIRE(plan.size() == static_cast<std::size_t>(div_ceil(n, (long)world) * world));
        }
    }
}

TEST_CASE("round-robin plan of three parameters on two ranks", "[optimizers][muon]") {
    auto plan = plan_shards(3, 2);
    REQUIRE(plan.size() == 4);
    REQUIRE(plan[0].Parameter == 0);
    REQUIRE(plan[1].Parameter == 1);
    REQUIRE(plan[2].Base == 2);
    REQUIRE(plan[2].Parameter == 2);
    REQUIRE(plan[3].Rank == 1);
    REQUIRE(plan[3].Parameter == -1);

    REQUIRE_THROWS_AS(plan_shards(3, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(plan_shards(-1, 2), std::invalid_argument);
}

TEST_CASE("two ranks produce the same parameters as one", "[optimizers][muon][cuda]") {
    if (!cuda_device_available()) {
        SKIP("CUDA not available");
    }
    // three same-shaped parameters form one group of two shards; the second shard has a placeholder
    HostProblem p = make_problem({{4, 4}, {4, 4}, {4, 4}}, 77);

    std::vector<std::vector<std::string>> events;
    auto single = run_ranks(p, 1, 2);
    auto pair = run_ranks(p, 2, 2, &events);

    for (int rank = 0; rank < 2; ++rank) {
        for (std::size_t i = 0; i < p.Names.size(); ++i) {
            INFO("rank " << rank << " parameter " << i);
            REQUIRE(relative_difference(pair[rank][i], single[0][i]) < 1e-5);
            // the step changed something
            REQUIRE(relative_difference(pair[rank][i], p.Params[i]) > 1e-3);
        }
    }

    // apply of shard 0 precedes the gather of shard 1, on both ranks, in both steps
    const std::vector<std::string> expected = {
        "GATHER(0,0)", "APPLIED(0,0)", "GATHER(0,1)", "APPLIED(0,1)",
        "GATHER(0,0)", "APPLIED(0,0)", "GATHER(0,1)", "APPLIED(0,1)",
    };
    REQUIRE(events[0] == expected);
    REQUIRE(events[1] == expected);
}

TEST_CASE("parameters of different sizes form separate groups", "[optimizers][muon][cuda]") {
    if (!cuda_device_available()) {
        SKIP("CUDA not available");
    }
    HostProblem p = make_problem({{8, 4}, {4, 8}, {16, 8}, {8, 8}, {8, 16}}, 5);
    auto single = run_ranks(p, 1, 1);
    auto triple = run_ranks(p, 3, 1);
    for (int rank = 0; rank < 3; ++rank) {
        for (std::size_t i = 0; i < p.Names.size(); ++i) {
            INFO("rank " << rank << " parameter " << i);
            REQUIRE(relative_difference(triple[rank][i], single[0][i]) < 1e-5);
        }
    }
}

TEST_CASE("momentum lives on the owning rank", "[optimizers][muon][cuda]") {
    if (!cuda_device_available()) {
        SKIP("CUDA not available");
    }
    HostProblem p = make_problem({{4, 4}, {4, 4}, {4, 4}}, 3);
    LoopbackExchange exchange(2);
    std::vector<std::exception_ptr> errors(2);
    std::vector<std::vector<bool>> held(2);
    std::vector<std::vector<int>> owners(2);
    std::vector<int> gathers(2, 0);

    auto work = [&](int rank) {
        try {
            CUDA_CHECK(cudaSetDevice(0));
            RankState state(p);
            LoopbackCollective comm(rank, exchange);
            Muon muon(state.Specs, {HyperParameters{}}, comm, state.Alloc, state.Stream);
            state.upload_grads(p);
            muon.step(StepParameters{}, state.lookup());
            for (const auto& name : p.Names) {
                held[rank].push_back(muon.momentum().contains(name));
                owners[rank].push_back(muon.owner(name));
            }
            gathers[rank] = comm.Gathers;
        } catch (...) {
            errors[rank] = std::current_exception();
            exchange.Barrier.arrive_and_drop();
        }
    };
    std::thread t0(work, 0);
    std::thread t1(work, 1);
    t0.join();
    t1.join();
    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    // one group, two shards: one gather per shard
    REQUIRE(gathers == std::vector<int>{2, 2});
    REQUIRE(owners[0] == std::vector<int>{0, 1, 0});
    REQUIRE(owners[1] == owners[0]);
    REQUIRE(held[0] == std::vector<bool>{true, false, true});
    REQUIRE(held[1] == std::vector<bool>{false, true, false});
}

TEST_CASE("spectral cap bounds the updated weights", "[optimizers][muon][cuda]") {
    if (!cuda_device_available()) {
        SKIP("CUDA not available");
    }
    const int n = 16;
    // a dominant direction with sigma ~ 10, well above the cap
    std::vector<float> w(n * n);
    fill_normal(w, 0.f, 0.01f, 11);
    for (int c = 0; c < n; ++c) {
        w[c] += 10.f / std::sqrt(static_cast<float>(n));
    }
    std::vector<float> g(n * n);
    fill_normal(g, 0.f, 1.f, 12);
    HostProblem p{{"w"}, {n}, {n}, {w}, {g}};

    RankState state(p);
    LoopbackExchange exchange(1);
    LoopbackCollective comm(0, exchange);
    Muon muon(state.Specs, {HyperParameters{0.01f, true, 1.0f}}, comm, state.Alloc, state.Stream);

    REQUIRE(spectral_norm_host(w, n, n) > 5.0);
    state.upload_grads(p);
    muon.step(StepParameters{1.0f, 0.95f, 0}, state.lookup());
    CUDA_CHECK(cudaStreamSynchronize(state.Stream));

    auto updated = from_device<float>(state.Specs[0].Param);
    REQUIRE(spectral_norm_host(updated, n, n) <= 1.0 + 1e-2);
    REQUIRE(muon.degenerate_count() == 0);
}

TEST_CASE("non-finite spectral norm leaves the weights uncapped and is counted", "[optimizers][muon][cuda]") {
    if (!cuda_device_available()) {
        SKIP("CUDA not available");
    }
    HostProblem p = make_problem({{8, 8}}, 21);
    p.Params[0][3] = std::numeric_limits<float>::quiet_NaN();

    RankState state(p);
    LoopbackExchange exchange(1);
    LoopbackCollective comm(0, exchange);
    Muon muon(state.Specs, {HyperParameters{0.01f, true, 1e-3f}}, comm, state.Alloc, state.Stream);

    state.upload_grads(p);
    REQUIRE_NOTHROW(muon.step(StepParameters{}, state.lookup()));
    REQUIRE(muon.degenerate_count() == 1);
}

TEST_CASE("muon reports invalid inputs", "[optimizers][muon][cuda][errors]") {
    if (!cuda_device_available()) {
        SKIP("CUDA not available");
    }
    HostProblem p = make_problem({{4, 8}, {4, 8}}, 9);
    RankState state(p);
    LoopbackExchange exchange(1);
    LoopbackCollective comm(0, exchange);

    SECTION("missing gradient") {
        Muon muon(state.Specs, {HyperParameters{}}, comm, state.Alloc, state.Stream);
        state.Grads.erase("p1");
        try {
            muon.step(StepParameters{}, state.lookup());
            FAIL("step without gradient did not throw");
        } catch (const UninitializedGradientError& e) {
            REQUIRE(e.param_name() == "p1");
        }
    }

    SECTION("gradient shape mismatch") {
        Muon muon(state.Specs, {HyperParameters{}}, comm, state.Alloc, state.Stream);
        state.Grads["p0"] = state.Alloc.allocate(ETensorDType::FP32, "bad", {8, 4});
        REQUIRE_THROWS_AS(muon.step(StepParameters{}, state.lookup()), ShapeError);
    }

    SECTION("duplicate names") {
        auto specs = state.Specs;
        specs[1].Name = specs[0].Name;
        REQUIRE_THROWS_AS(Muon(specs, {HyperParameters{}}, comm, state.Alloc, state.Stream), std::invalid_argument);
    }

    SECTION("unknown hyper-parameter set") {
        auto specs = state.Specs;
        specs[0].HyperSet = 1;
        REQUIRE_THROWS_AS(Muon(specs, {HyperParameters{}}, comm, state.Alloc, state.Stream), std::invalid_argument);
    }

    SECTION("unknown coefficient table") {
        REQUIRE_THROWS_AS(Muon(state.Specs, {HyperParameters{}}, comm, state.Alloc, state.Stream, "ns9"), std::invalid_argument);
    }

    SECTION("vector parameter") {
        auto specs = state.Specs;
        specs[0].Param = state.Alloc.allocate(ETensorDType::FP32, "bias", {32});
        REQUIRE_THROWS_AS(Muon(specs, {HyperParameters{}}, comm, state.Alloc, state.Stream), ShapeError);
    }

    SECTION("unknown name") {
        Muon muon(state.Specs, {HyperParameters{}}, comm, state.Alloc, state.Stream);
        REQUIRE(muon.owner("p0") == 0);
        REQUIRE(muon.owns("p1"));
        REQUIRE_THROWS_AS(muon.owner("p2"), std::out_of_range);
    }
}
