// ====================================================================================
// RAINMETA - Metadata Resolver
//
// The transport that fetches meta bytes and deployer bundles from subgraph
// endpoints is supplied by the caller. The library only races the endpoints.
// ====================================================================================

#ifndef RAINMETA_RESOLVER_HPP_
#define RAINMETA_RESOLVER_HPP_

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rainmeta/logging.hpp"
#include "rainmeta/thread_pool.hpp"
#include "rainmeta/types.hpp"

namespace rainmeta::v1 {

struct MetaResponse {
    byte_vec bytes;
};

struct DeployerResponse {
    byte_vec meta_hash;
    byte_vec meta_bytes;
    byte_vec bytecode_meta_hash;
    byte_vec bytecode;
    byte_vec parser;
    byte_vec store;
    byte_vec interpreter;
    byte_vec tx_hash;

    // AuthoringMetaV1 item of the deployer's meta sequence, if it has one.
    std::optional<AuthoringMeta> AuthoringMetaFromMeta() const;
};

class MetadataResolver {
public:
    virtual ~MetadataResolver() = default;
    // `hash` is 0x-prefixed lowercase hex.
    virtual util::StatusOr<MetaResponse> Query(const std::string& hash, const std::string& endpoint) = 0;
    virtual util::StatusOr<DeployerResponse> QueryDeployer(const std::string& hash, const std::string& endpoint) = 0;
};

// Starts `request` for every endpoint at once on the shared ThreadPool and returns
// the first success. Requests that finish later keep running; their results are dropped.
template <typename T>
util::StatusOr<T> RaceFirstSuccess(const std::vector<std::string>& endpoints,
                                   std::function<util::StatusOr<T>(const std::string&)> request) {
    if (endpoints.empty()) return util::Status::NotFound("no subgraph endpoints registered");

    struct RaceState {
        std::mutex mutex;
        std::condition_variable done;
        std::optional<T> winner;
        size_t failures = 0;
        util::Status last_error;
    };
    auto state = std::make_shared<RaceState>();
    auto record_failure = [state](util::Status status) {
        std::lock_guard<std::mutex> lock(state->mutex);
        ++state->failures;
        state->last_error = std::move(status);
        state->done.notify_all();
    };

    std::vector<std::function<void()>> batch;
    batch.reserve(endpoints.size());
    for (const auto& endpoint : endpoints) {
        batch.emplace_back([state, request, endpoint, record_failure]() {
            util::StatusOr<T> result = request(endpoint);
            if (!result.ok()) {
                RAINMETA_LOG_DEBUG("resolver", endpoint + ": " + result.status().message());
                record_failure(result.status());
                return;
            }
            std::lock_guard<std::mutex> lock(state->mutex);
            if (!state->winner) state->winner = std::move(result.value());
            state->done.notify_all();
        });
    }
    RAINMETA_RETURN_IF_ERROR(ThreadPool::GetInstance().SubmitConcurrently(std::move(batch)));

    std::unique_lock<std::mutex> lock(state->mutex);
    state->done.wait(lock, [&] { return state->winner.has_value() || state->failures == endpoints.size(); });
    if (state->winner) return std::move(*state->winner);
    return util::Status::ResolverError("all " + std::to_string(endpoints.size()) +
                                       " endpoints failed, last error: " + state->last_error.message());
}

util::StatusOr<MetaResponse> Search(const std::shared_ptr<MetadataResolver>& resolver, util::Span<const uint8_t> hash,
                                    const std::vector<std::string>& endpoints);
util::StatusOr<DeployerResponse> SearchDeployer(const std::shared_ptr<MetadataResolver>& resolver,
                                                util::Span<const uint8_t> hash, const std::vector<std::string>& endpoints);

}  // namespace rainmeta::v1

#endif  // RAINMETA_RESOLVER_HPP_
