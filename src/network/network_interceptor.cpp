// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file network_interceptor.cpp
 * @brief Outbound HTTP recording and mock engine
 *
 * Thread safety: perform() may run concurrently from any number of host
 * threads. Mocks are copied out of the lock before their delay so a slow
 * mock never blocks other calls or mock edits.
 */

#include "network_interceptor.h"

#include "bridge_error.h"
#include "error_reporting.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <random>

namespace devbridge {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

json headers_to_json(const HeaderMap& headers) {
    json j = json::object();
    for (const auto& [name, value] : headers) {
        j[name] = value;
    }
    return j;
}

/// Response bodies are returned parsed when they are JSON, verbatim otherwise
json body_to_json(const std::string& body) {
    if (body.empty()) {
        return nullptr;
    }
    try {
        return json::parse(body);
    } catch (const json::parse_error&) {
        return body;
    }
}

} // namespace

json NetworkRecord::to_json() const {
    json j = {{"id", id},
              {"url", url},
              {"method", method},
              {"timestamp", timestamp_ms},
              {"requestHeaders", headers_to_json(request_headers)}};
    if (!request_body.empty()) {
        j["requestBody"] = body_to_json(request_body);
    }
    j["status"] = status ? json(*status) : json(nullptr);
    j["duration"] = duration_ms ? json(*duration_ms) : json(nullptr);
    if (!response_body.empty()) {
        j["responseBody"] = body_to_json(response_body);
    }
    if (!error.empty()) {
        j["error"] = error;
    }
    if (!mock_id.empty()) {
        j["mocked"] = true;
        j["mockId"] = mock_id;
    }
    return j;
}

struct InterceptingTransport::State {
    State(std::shared_ptr<HttpTransport> inner_transport, size_t max_records)
        : inner(std::move(inner_transport)), capacity(max_records), rng(std::random_device{}()) {}

    std::string generate_id(const char* prefix);
    OutboundResponse perform_recorded(const OutboundRequest& request, std::string* record_id);
    void update_record(const std::string& id, const OutboundResponse& response,
                       int64_t duration_ms, const std::string& mock_id);

    /// Sleep for a mock delay; @return false if interrupted by stop()
    bool wait_delay(uint32_t delay_ms);
    void stop();

    std::shared_ptr<HttpTransport> inner;
    size_t capacity;

    std::mutex mutex;
    std::condition_variable stop_cv;
    bool stopping = false;
    std::deque<NetworkRecord> records; ///< Front is most recent
    std::vector<NetworkMock> mocks;
    std::mt19937 rng;
};

std::string InterceptingTransport::State::generate_id(const char* prefix) {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> dist(0, 35);
    std::string suffix;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (int i = 0; i < 9; ++i) {
            suffix += kAlphabet[dist(rng)];
        }
    }
    return std::string(prefix) + "_" + std::to_string(json_util::now_epoch_ms()) + "_" + suffix;
}

bool InterceptingTransport::State::wait_delay(uint32_t delay_ms) {
    std::unique_lock<std::mutex> lock(mutex);
    return !stop_cv.wait_for(lock, std::chrono::milliseconds(delay_ms),
                             [this] { return stopping; });
}

void InterceptingTransport::State::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    stop_cv.notify_all();
}

OutboundResponse InterceptingTransport::State::perform_recorded(const OutboundRequest& request,
                                                                std::string* record_id) {
    NetworkRecord record;
    record.id = generate_id("req");
    record.url = request.url;
    record.method = to_upper(request.method);
    record.request_headers = request.headers;
    record.request_body = request.body;
    record.timestamp_ms = json_util::now_epoch_ms();
    const std::string id = record.id;
    if (record_id) {
        *record_id = id;
    }

    std::optional<NetworkMock> mock;
    {
        std::lock_guard<std::mutex> lock(mutex);
        records.push_front(std::move(record));
        while (records.size() > capacity) {
            records.pop_back();
        }

        for (const auto& m : mocks) {
            if (std::regex_search(request.url, m.regex)) {
                mock = m;
                break;
            }
        }
    }

    auto start = std::chrono::steady_clock::now();
    OutboundResponse response;

    if (mock) {
        spdlog::debug("[Network Interceptor] {} {} answered by mock {}", request.method,
                      request.url, mock->id);
        if (mock->delay_ms > 0 && !wait_delay(mock->delay_ms)) {
            response.error = "Interrupted by shutdown";
        } else {
            response.status = mock->status;
            response.headers = mock->headers;
            response.body = mock->body.is_string() ? mock->body.get<std::string>()
                            : mock->body.is_null() ? std::string()
                                                   : mock->body.dump();
        }
    } else if (inner) {
        try {
            response = inner->perform(request);
        } catch (const std::exception& e) {
            // Transports should report failures via status 0, but a throwing one
            // must not take the host's call path down with it
            LOG_ERROR_INTERNAL("[Network Interceptor] Transport threw for {}: {}", request.url,
                               e.what());
            response = OutboundResponse{};
            response.error = e.what();
        }
    } else {
        response.error = "No transport configured";
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start)
                        .count();
    update_record(id, response, duration, mock ? mock->id : std::string());
    return response;
}

void InterceptingTransport::State::update_record(const std::string& id,
                                                 const OutboundResponse& response,
                                                 int64_t duration_ms, const std::string& mock_id) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& rec : records) {
        if (rec.id == id) {
            rec.status = response.transport_ok() || !mock_id.empty() ? response.status : 0;
            rec.duration_ms = duration_ms;
            rec.response_body = response.body;
            rec.error = response.error;
            rec.mock_id = mock_id;
            return;
        }
    }
    // Evicted while in flight; nothing to update
}

InterceptingTransport::InterceptingTransport(std::shared_ptr<HttpTransport> inner, size_t capacity)
    : state_(std::make_shared<State>(std::move(inner), capacity)) {}

InterceptingTransport::~InterceptingTransport() {
    // Signal shutdown, cut mock delays short and wait for replay threads with timeout
    shutting_down_.store(true);
    state_->stop();

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers = std::move(workers_);
    }

    constexpr auto kJoinTimeout = std::chrono::seconds(2);
    constexpr auto kPollInterval = std::chrono::milliseconds(10);

    for (auto& w : workers) {
        if (!w.thread.joinable()) {
            continue;
        }
        auto start = std::chrono::steady_clock::now();
        while (!w.done->load()) {
            if (std::chrono::steady_clock::now() - start > kJoinTimeout) {
                break;
            }
            std::this_thread::sleep_for(kPollInterval);
        }
        if (w.done->load()) {
            w.thread.join();
        } else {
            // The worker keeps its own reference to state_
            spdlog::warn("[Network Interceptor] Replay thread still running after {}s - "
                         "detaching",
                         kJoinTimeout.count());
            w.thread.detach();
        }
    }
}

OutboundResponse InterceptingTransport::perform(const OutboundRequest& request) {
    return state_->perform_recorded(request, nullptr);
}

std::string InterceptingTransport::add_mock(const std::string& url_pattern, int status, json body,
                                            HeaderMap headers, uint32_t delay_ms) {
    NetworkMock mock;
    try {
        mock.regex = std::regex(url_pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw CommandError(BridgeErrorType::INVALID_PARAMS,
                           "Invalid urlPattern '" + url_pattern + "': " + e.what());
    }
    mock.id = state_->generate_id("mock");
    mock.url_pattern = url_pattern;
    mock.status = status;
    mock.body = std::move(body);
    mock.headers = std::move(headers);
    mock.delay_ms = delay_ms;

    std::string id = mock.id;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->mocks.push_back(std::move(mock));
    }
    spdlog::info("[Network Interceptor] Added mock {} for /{}/ -> {}", id, url_pattern, status);
    return id;
}

bool InterceptingTransport::remove_mock(const std::string& mock_id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto& mocks = state_->mocks;
    auto it = std::find_if(mocks.begin(), mocks.end(),
                           [&](const NetworkMock& m) { return m.id == mock_id; });
    if (it == mocks.end()) {
        return false;
    }
    mocks.erase(it);
    return true;
}

size_t InterceptingTransport::clear_mocks() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    size_t count = state_->mocks.size();
    state_->mocks.clear();
    return count;
}

size_t InterceptingTransport::mock_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->mocks.size();
}

size_t InterceptingTransport::record_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->records.size();
}

json InterceptingTransport::list_requests(const NetworkRequestFilter& filter) const {
    std::optional<std::string> method;
    if (filter.method) {
        method = to_upper(*filter.method);
    }

    std::lock_guard<std::mutex> lock(state_->mutex);
    json result = json::array();
    for (const auto& rec : state_->records) {
        if (result.size() >= filter.limit) {
            break;
        }
        if (filter.url && rec.url.find(*filter.url) == std::string::npos) {
            continue;
        }
        if (method && rec.method != *method) {
            continue;
        }
        result.push_back(rec.to_json());
    }
    return result;
}

std::optional<NetworkRecord> InterceptingTransport::find_record(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (const auto& rec : state_->records) {
        if (rec.id == request_id) {
            return rec;
        }
    }
    return std::nullopt;
}

bool InterceptingTransport::replay(const std::string& request_id, const json& modifications,
                                   std::function<void(json)> on_complete) {
    auto original = find_record(request_id);
    if (!original) {
        return false;
    }

    OutboundRequest req;
    req.method = original->method;
    req.url = original->url;
    req.headers = original->request_headers;
    req.body = original->request_body;
    if (modifications.is_object()) {
        if (modifications.contains("headers") && modifications["headers"].is_object()) {
            for (const auto& [name, value] : modifications["headers"].items()) {
                req.headers[name] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
        if (modifications.contains("body")) {
            const auto& body = modifications["body"];
            req.body = body.is_string() ? body.get<std::string>() : body.dump();
        }
    }

    spdlog::info("[Network Interceptor] Replaying {} {} ({})", req.method, req.url, request_id);

    bool launched = launch_worker([state = state_, req, request_id, on_complete]() {
        std::string replay_id;
        OutboundResponse resp = state->perform_recorded(req, &replay_id);

        json result;
        if (resp.status > 0) {
            result = {{"success", true},
                      {"requestId", request_id},
                      {"replayId", replay_id},
                      {"status", resp.status},
                      {"body", body_to_json(resp.body)}};
        } else {
            result = {{"success", false}, {"error", resp.error}, {"requestId", request_id}};
        }

        try {
            on_complete(std::move(result));
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[Network Interceptor] Replay callback threw: {}", e.what());
        }
    });

    if (!launched) {
        on_complete({{"success", false}, {"error", "Shutting down"}, {"requestId", request_id}});
    }
    return true;
}

bool InterceptingTransport::launch_worker(std::function<void()> func) {
    if (shutting_down_.load()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(workers_mutex_);

    // Reap finished workers
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    Worker w;
    w.done = done;
    w.thread = std::thread([func = std::move(func), done]() {
        try {
            func();
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[Network Interceptor] Worker threw: {}", e.what());
        }
        done->store(true);
    });
    workers_.push_back(std::move(w));
    return true;
}

} // namespace devbridge
