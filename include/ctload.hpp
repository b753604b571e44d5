/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file ctload.hpp
 * @brief ctload - concurrent streaming load harness
 *
 * Opens and sustains many persistent streaming connections (WebSocket, SSE,
 * newline-delimited TCP) against one endpoint, reconnects on failure and
 * aggregates connection/message/error counts across all of them.
 *
 * Usage:
 *   #include "ctload.hpp"
 *
 *   int main() {
 *     sockpp::initialize();
 *     ctload::SignalInterruptSource interrupt;
 *     auto endpoint = ctload::Endpoint::parse("ws://localhost:8080/");
 *     auto transport = ctload::StreamTransport::create(endpoint.value());
 *     ctload::PoolConfig config;
 *     config.worker_count = 100;
 *     ctload::PoolSupervisor pool(config,
 *                                 std::make_shared<ctload::Endpoint>(endpoint.value()),
 *                                 transport.value(),
 *                                 std::make_shared<ctload::ConsoleWriter>(std::cout));
 *     pool.run(interrupt);
 *   }
 *
 * @see RFC 6455: The WebSocket Protocol
 * @see HTML Living Standard, Server-sent events
 */

#ifndef CTLOAD_HPP_
#define CTLOAD_HPP_

#include "ctload/cli.hpp"
#include "ctload/codec.hpp"
#include "ctload/config.hpp"
#include "ctload/endpoint.hpp"
#include "ctload/http.hpp"
#include "ctload/link.hpp"
#include "ctload/log.hpp"
#include "ctload/metrics.hpp"
#include "ctload/rx_buffer.hpp"
#include "ctload/shutdown.hpp"
#include "ctload/stats_reporter.hpp"
#include "ctload/supervisor.hpp"
#include "ctload/tls.hpp"
#include "ctload/transport.hpp"
#include "ctload/utils.hpp"
#include "ctload/vocabulary.hpp"
#include "ctload/worker.hpp"

#endif  // CTLOAD_HPP_
