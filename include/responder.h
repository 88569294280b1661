// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_protocol.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace devbridge {

/**
 * @brief One-shot reply channel for a single request
 *
 * Copies share state, so a handler can hand the responder to another thread.
 * The first resolve()/reject() sends; every later call is dropped with a
 * warning. This is what guarantees exactly one response per request id even
 * when an async action misbehaves.
 */
class Responder {
  public:
    using SendFn = std::function<void(const ResponseFrame&)>;

    Responder(RequestId id, std::string method, SendFn send);

    /// @return true if this call sent the response
    bool resolve(json result) const;

    /// @return true if this call sent the response
    bool reject(const BridgeError& error) const;

    [[nodiscard]] bool has_replied() const;
    [[nodiscard]] RequestId id() const;
    [[nodiscard]] const std::string& method() const;

  private:
    bool send_once(const ResponseFrame& frame) const;

    struct State {
        RequestId id;
        std::string method;
        SendFn send;
        std::atomic<bool> replied{false};
    };
    std::shared_ptr<State> state_;
};

} // namespace devbridge
