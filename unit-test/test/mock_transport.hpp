#pragma once

#include <algorithm>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "common/exceptions.hpp"
#include "execution/http.hpp"
#include "execution/simulation.hpp"

/**
 * @brief 记录所有请求并按顺序返回预设响应的 HTTP 传输层
 * 预设响应用完后，之后的请求都会被当作无法连接
 */
class mock_transport {
public:
    mock_transport() : state(std::make_shared<shared_state>()) {}

    mock_transport &respond(long status, const std::string &body) {
        state->replies.push_back([status, body](const coderun::http_request &) {
            return coderun::http_response{status, body};
        });
        return *this;
    }

    mock_transport &refuse() {
        state->replies.push_back([](const coderun::http_request &request) -> coderun::http_response {
            throw coderun::network_error("request to " + request.url + " failed: Couldn't connect to server", true);
        });
        return *this;
    }

    mock_transport &time_out() {
        state->replies.push_back([](const coderun::http_request &request) -> coderun::http_response {
            throw coderun::network_error("request to " + request.url + " failed: Timeout was reached");
        });
        return *this;
    }

    coderun::http_transport transport() const {
        auto s = state;
        return [s](const coderun::http_request &request) {
            s->requests.push_back(request);
            if (s->replies.empty())
                throw coderun::network_error("request to " + request.url + " failed: Couldn't connect to server", true);
            auto reply = s->replies.front();
            s->replies.pop_front();
            return reply(request);
        };
    }

    std::size_t calls() const {
        return state->requests.size();
    }

    const std::vector<coderun::http_request> &requests() const {
        return state->requests;
    }

private:
    struct shared_state {
        std::deque<std::function<coderun::http_response(const coderun::http_request &)>> replies;
        std::vector<coderun::http_request> requests;
    };

    std::shared_ptr<shared_state> state;
};

/**
 * @brief 按顺序返回给定数字的随机数来源，用完后一直返回最后一个数
 */
inline coderun::random_source fixed_random(std::vector<double> values) {
    auto index = std::make_shared<std::size_t>(0);
    return [values, index]() {
        double value = values[std::min(*index, values.size() - 1)];
        ++*index;
        return value;
    };
}
