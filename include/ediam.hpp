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
 * @file ediam.hpp
 * @brief EDIAM - Embedded Diameter peer server
 *
 * Connection and dispatch layer for Diameter (RFC 6733) peers: 20-byte
 * header codec, per-connection read/dispatch loop over TCP or TLS,
 * accept loop with backoff, and a command multiplexer keyed by dictionary
 * short name.
 *
 * Usage:
 *   #include "ediam.hpp"
 *
 *   int main() {
 *     auto mux = ediam::make_serve_mux();
 *     mux->handle_func("CER", [](const ediam::ConnPtr& c, const ediam::MessagePtr& m) {
 *       c->write_message(*m->make_answer());
 *     });
 *     ediam::listen_and_serve(":3868", mux, nullptr);
 *   }
 *
 * @see RFC 6733: Diameter Base Protocol
 */

#ifndef EDIAM_HPP_
#define EDIAM_HPP_

#include "ediam/connection.hpp"
#include "ediam/dictionary.hpp"
#include "ediam/executor.hpp"
#include "ediam/handler.hpp"
#include "ediam/header.hpp"
#include "ediam/io.hpp"
#include "ediam/log.hpp"
#include "ediam/message.hpp"
#include "ediam/ring_buffer.hpp"
#include "ediam/serve_mux.hpp"
#include "ediam/server.hpp"
#include "ediam/stack_trace.hpp"
#include "ediam/stats.hpp"
#include "ediam/sync.hpp"
#include "ediam/tls.hpp"
#include "ediam/transport.hpp"
#include "ediam/vocabulary.hpp"

#endif  // EDIAM_HPP_
