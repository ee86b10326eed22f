#pragma once

#include <nlohmann/json.hpp>
#include <relgraph/graph/model/graph_normalizer.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace relgraph {
namespace net {

/*
 * Talks to the connections service:
 *   POST <endpoint>/api/connections         -> { sourceNode?, connections, links? }
 *   POST <endpoint>/api/connections/expand  -> { connections, links }
 * Transport failures and non-200 replies throw std::runtime_error.
 */
class ConnectionsClient {
public:
    ConnectionsClient(std::string endpoint_url, std::string model_id);

    graph::ConnectionsInput FetchConnections(const graph::SourceDescriptor& source,
                                             const std::string& parent_node_id = "source");

    // Returns only the new nodes and the links that attach them.
    graph::PrebuiltGraph ExpandNode(const graph::PrebuiltGraph& existing,
                                    const std::string& node_id,
                                    const graph::SourceDescriptor& source);

    const std::string& getEndpointUrl() const { return endpoint_url_; }

    static nlohmann::json BuildGenerateRequest(const graph::SourceDescriptor& source,
                                               const std::string& model_id,
                                               const std::string& parent_node_id);
    static nlohmann::json BuildExpandRequest(const graph::PrebuiltGraph& existing,
                                             const std::string& node_id,
                                             const graph::SourceDescriptor& source,
                                             const std::string& model_id);
    static std::string JoinUrl(const std::string& base, const std::string& path);

private:
    std::string PostJson(const std::string& url, const nlohmann::json& body);

    std::string endpoint_url_;
    std::string model_id_;
};

// Appends expanded nodes and links to an existing prebuilt payload.
// Duplicate ids are left for the normalizer to drop.
void AppendExpansion(graph::PrebuiltGraph& existing, const graph::PrebuiltGraph& expansion);

enum class FetchKind {
    GENERATE,
    EXPAND
};

struct FetchResult {
    FetchKind kind = FetchKind::GENERATE;
    std::optional<graph::ConnectionsInput> payload;
    std::string error;
};

/*
 * Runs fetch jobs one at a time on a worker thread. Results are picked up on
 * the GUI thread with Drain(), once per frame.
 */
class AsyncConnectionsFetcher {
public:
    using Job = std::function<graph::ConnectionsInput()>;

    AsyncConnectionsFetcher();
    ~AsyncConnectionsFetcher();

    AsyncConnectionsFetcher(const AsyncConnectionsFetcher&) = delete;
    AsyncConnectionsFetcher& operator=(const AsyncConnectionsFetcher&) = delete;

    void Submit(FetchKind kind, Job job);
    std::vector<FetchResult> Drain();

    // True from Submit until the job's result has been drained.
    bool IsBusy() const { return outstanding_.load() > 0; }

private:
    struct PendingJob {
        FetchKind kind = FetchKind::GENERATE;
        Job job;
    };

    void WorkerLoop(std::stop_token st);

    std::mutex mutex_;
    std::condition_variable_any jobs_cv_;
    std::deque<PendingJob> jobs_;
    std::vector<FetchResult> results_;
    std::atomic<int> outstanding_{0};
    std::jthread worker_;
};

} // namespace net
} // namespace relgraph
