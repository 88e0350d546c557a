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
 * @file mws.hpp
 * @brief MWS - Minimal WebSocket Server
 *
 * Blocking TCP listener with one session thread per client. Each session
 * performs the upgrade handshake, registers the client, and delivers every
 * decoded frame to the application in order. Outbound messages are text,
 * binary, or a delta (a count-prefixed list of key/value updates and key
 * deletions) and may be broadcast to every registered client.
 *
 * Usage:
 *   #include "mws.hpp"
 *
 *   int main() {
 *     mws::Server server(8001);
 *     server.on_message = [](mws::Server&, const mws::ConnPtr& conn, std::string_view msg) {
 *       (void)conn->send(msg);
 *     };
 *     server.run();
 *   }
 *
 * @see RFC 6455: The WebSocket Protocol
 */

#ifndef MWS_HPP_
#define MWS_HPP_

#include "mws/client_registry.hpp"
#include "mws/connection.hpp"
#include "mws/crypto.hpp"
#include "mws/frame.hpp"
#include "mws/handshake.hpp"
#include "mws/log.hpp"
#include "mws/server.hpp"
#include "mws/server_stats.hpp"
#include "mws/vocabulary.hpp"

#endif  // MWS_HPP_
