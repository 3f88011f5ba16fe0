#pragma once

#include <net/http_client.hpp>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace Prebuilt::Testing {

/**
 * In-memory HttpClient. Unknown URLs answer 404; queued failures for a URL
 * are returned before its served body.
 */
class FakeHttpClient : public HttpClient {
public:
    static constexpr long TRANSPORT_FAILURE = -1;

    void serve(const std::string& url, std::vector<uint8_t> body) {
        bodies_[url] = std::move(body);
    }

    void serve(const std::string& url, const std::string& body) {
        serve(url, std::vector<uint8_t>(body.begin(), body.end()));
    }

    void queue_status(const std::string& url, long status) {
        queued_[url].push_back(status);
    }

    void queue_transport_failure(const std::string& url) {
        queued_[url].push_back(TRANSPORT_FAILURE);
    }

    int requests(const std::string& url) const {
        auto it = counts_.find(url);
        return it == counts_.end() ? 0 : it->second;
    }

    int total_requests() const { return total_; }

    HttpResponse get(const std::string& url) override {
        ++counts_[url];
        ++total_;

        auto queued = queued_.find(url);
        if (queued != queued_.end() && !queued->second.empty()) {
            long status = queued->second.front();
            queued->second.pop_front();
            if (status == TRANSPORT_FAILURE) {
                throw TransportError("connection reset: " + url);
            }
            return HttpResponse{status, {}};
        }

        auto body = bodies_.find(url);
        if (body == bodies_.end()) {
            return HttpResponse{404, {}};
        }
        return HttpResponse{200, body->second};
    }

private:
    std::map<std::string, std::vector<uint8_t>> bodies_;
    std::map<std::string, std::deque<long>> queued_;
    std::map<std::string, int> counts_;
    int total_ = 0;
};

} // namespace Prebuilt::Testing
