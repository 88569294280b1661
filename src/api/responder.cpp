// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "responder.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

namespace devbridge {

Responder::Responder(RequestId id, std::string method, SendFn send)
    : state_(std::make_shared<State>()) {
    state_->id = id;
    state_->method = std::move(method);
    state_->send = std::move(send);
}

bool Responder::resolve(json result) const {
    return send_once(ResponseFrame::success(state_->id, std::move(result)));
}

bool Responder::reject(const BridgeError& error) const {
    BridgeError err = error;
    if (err.method.empty()) {
        err.method = state_->method;
    }
    if (!err.has_error()) {
        err.type = BridgeErrorType::UNKNOWN;
    }
    return send_once(ResponseFrame::failure(state_->id, std::move(err)));
}

bool Responder::has_replied() const {
    return state_->replied.load();
}

RequestId Responder::id() const {
    return state_->id;
}

const std::string& Responder::method() const {
    return state_->method;
}

bool Responder::send_once(const ResponseFrame& frame) const {
    if (state_->replied.exchange(true)) {
        spdlog::warn("[Responder] Duplicate reply for request {} ({}) dropped", state_->id,
                     state_->method);
        return false;
    }

    if (!state_->send) {
        return true;
    }

    try {
        state_->send(frame);
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[Responder] Sending reply for request {} ({}) threw: {}", state_->id,
                           state_->method, e.what());
    }
    return true;
}

} // namespace devbridge
