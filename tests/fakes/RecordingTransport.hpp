#pragma once
#include "sdk/Transport.hpp"
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Records every request and answers from a queue of canned responses.
// When the queue is empty it answers with the default response.
class RecordingTransport : public sdk::Transport {
public:
    sdk::HttpResponse perform(const sdk::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex);
        requests.push_back(request);
        if (failure) {
            throw sdk::TransportError(*failure);
        }
        if (!responses.empty()) {
            sdk::HttpResponse response = responses.front();
            responses.pop_front();
            return response;
        }
        return defaultResponse;
    }

    void enqueue(long status, std::string body,
                 std::string content_type = "application/json") {
        std::lock_guard<std::mutex> lock(mutex);
        sdk::HttpResponse response;
        response.status = status;
        response.body = std::move(body);
        response.headers["content-type"] = std::move(content_type);
        responses.push_back(std::move(response));
    }

    void failWith(std::string message) {
        std::lock_guard<std::mutex> lock(mutex);
        failure = std::move(message);
    }

    std::vector<sdk::HttpRequest> getRequests() const {
        std::lock_guard<std::mutex> lock(mutex);
        return requests;
    }

    size_t callCount() const {
        std::lock_guard<std::mutex> lock(mutex);
        return requests.size();
    }

    sdk::HttpResponse defaultResponse{200, {{"content-type", "application/json"}}, ""};

private:
    mutable std::mutex mutex;
    std::vector<sdk::HttpRequest> requests;
    std::deque<sdk::HttpResponse> responses;
    std::optional<std::string> failure;
};
