// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 OtterStax

#pragma once

#include <chrono>
#include <string>

struct mock_config {
    // simulated round trip time, spent on an asio timer
    std::chrono::milliseconds wait_time = std::chrono::milliseconds(0);
    // batches containing this text fail with an operational_error
    std::string fail_on = "";
    std::string error_message = "MockSession: server closed the connection";
    std::string alias = "mock_session";
};
