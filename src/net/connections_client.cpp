#include <relgraph/net/connections_client.h>
#include <relgraph/graph/model/payload_json.h>
#include <relgraph/net/curl_utils.h>

#include <curl/curl.h>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace relgraph {
namespace net {

namespace {
constexpr const char* kGeneratePath = "/api/connections";
constexpr const char* kExpandPath = "/api/connections/expand";
constexpr long kRequestTimeoutSeconds = 120L;

nlohmann::json original_source_json(const graph::SourceDescriptor& source) {
    return {
        {"content", source.content},
        {"metadata", source.metadata.is_object() ? source.metadata : nlohmann::json::object()}
    };
}
} // namespace

ConnectionsClient::ConnectionsClient(std::string endpoint_url, std::string model_id)
    : endpoint_url_(std::move(endpoint_url)), model_id_(std::move(model_id)) {}

std::string ConnectionsClient::JoinUrl(const std::string& base, const std::string& path) {
    std::string url = base;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + path;
}

nlohmann::json ConnectionsClient::BuildGenerateRequest(const graph::SourceDescriptor& source,
                                                       const std::string& model_id,
                                                       const std::string& parent_node_id) {
    nlohmann::json payload;
    payload["source"] = source.content;
    payload["metadata"] = source.metadata.is_object() ? source.metadata : nlohmann::json::object();
    payload["modelId"] = model_id;
    payload["parentNodeId"] = parent_node_id;
    return payload;
}

nlohmann::json ConnectionsClient::BuildExpandRequest(const graph::PrebuiltGraph& existing,
                                                     const std::string& node_id,
                                                     const graph::SourceDescriptor& source,
                                                     const std::string& model_id) {
    const graph::NodeSpec* expanded = nullptr;
    for (const auto& spec : existing.connections) {
        if (spec.id == node_id) {
            expanded = &spec;
            break;
        }
    }
    if (!expanded && existing.source_node && existing.source_node->id == node_id) {
        expanded = &existing.source_node.value();
    }
    if (!expanded) {
        throw std::runtime_error("Cannot expand unknown node '" + node_id + "'");
    }

    nlohmann::json existing_connections = nlohmann::json::array();
    for (const auto& spec : existing.connections) {
        existing_connections.push_back(graph::ToJson(spec));
    }

    nlohmann::json payload;
    payload["sourceNode"] = graph::ToJson(*expanded);
    payload["originalSource"] = original_source_json(source);
    payload["existingConnections"] = std::move(existing_connections);
    payload["modelId"] = model_id;
    return payload;
}

std::string ConnectionsClient::PostJson(const std::string& url, const nlohmann::json& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }
    auto curl_guard = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>{curl, curl_easy_cleanup};

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");
    auto headers_guard = std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)>{headers, curl_slist_free_all};

    std::string json_payload = body.dump();
    std::string response_buffer;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, kRequestTimeoutSeconds);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw std::runtime_error("API request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        throw std::runtime_error("API request returned HTTP status " + std::to_string(http_code) + ". Response: " + response_buffer);
    }
    return response_buffer;
}

graph::ConnectionsInput ConnectionsClient::FetchConnections(const graph::SourceDescriptor& source,
                                                            const std::string& parent_node_id) {
    nlohmann::json request = BuildGenerateRequest(source, model_id_, parent_node_id);
    std::string response = PostJson(JoinUrl(endpoint_url_, kGeneratePath), request);
    return graph::ParseConnectionsPayload(response);
}

graph::PrebuiltGraph ConnectionsClient::ExpandNode(const graph::PrebuiltGraph& existing,
                                                   const std::string& node_id,
                                                   const graph::SourceDescriptor& source) {
    nlohmann::json request = BuildExpandRequest(existing, node_id, source, model_id_);
    std::string response = PostJson(JoinUrl(endpoint_url_, kExpandPath), request);

    graph::ConnectionsInput parsed = graph::ParseConnectionsPayload(response);
    if (auto* prebuilt = std::get_if<graph::PrebuiltGraph>(&parsed)) {
        prebuilt->source_node.reset();
        return std::move(*prebuilt);
    }

    // A bare list attaches every new node to the expanded one.
    graph::PrebuiltGraph expansion;
    expansion.connections = std::move(std::get<graph::FlatConnections>(parsed).connections);
    for (const auto& spec : expansion.connections) {
        graph::LinkSpec link;
        link.source = node_id;
        link.target = spec.id;
        link.relationship = spec.relationship;
        link.distance = spec.distance;
        link.type = spec.type;
        expansion.links.push_back(std::move(link));
    }
    return expansion;
}

void AppendExpansion(graph::PrebuiltGraph& existing, const graph::PrebuiltGraph& expansion) {
    existing.connections.insert(existing.connections.end(),
                                expansion.connections.begin(), expansion.connections.end());
    existing.links.insert(existing.links.end(), expansion.links.begin(), expansion.links.end());
}

AsyncConnectionsFetcher::AsyncConnectionsFetcher()
    : worker_([this](std::stop_token st) { WorkerLoop(st); }) {}

AsyncConnectionsFetcher::~AsyncConnectionsFetcher() {
    worker_.request_stop();
    jobs_cv_.notify_all();
    // jthread joins automatically
}

void AsyncConnectionsFetcher::Submit(FetchKind kind, Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(PendingJob{kind, std::move(job)});
        ++outstanding_;
    }
    jobs_cv_.notify_one();
}

std::vector<FetchResult> AsyncConnectionsFetcher::Drain() {
    std::vector<FetchResult> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(results_);
    }
    outstanding_ -= static_cast<int>(drained.size());
    return drained;
}

void AsyncConnectionsFetcher::WorkerLoop(std::stop_token st) {
    while (!st.stop_requested()) {
        PendingJob pending;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!jobs_cv_.wait(lock, st, [this] { return !jobs_.empty(); })) {
                return;
            }
            pending = std::move(jobs_.front());
            jobs_.pop_front();
        }

        FetchResult result;
        result.kind = pending.kind;
        try {
            result.payload = pending.job();
        } catch (const std::exception& e) {
            std::cerr << "Error: Connections request failed: " << e.what() << std::endl;
            result.error = e.what();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        results_.push_back(std::move(result));
    }
}

} // namespace net
} // namespace relgraph
