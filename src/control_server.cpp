//
// Created by opencode on 18/10/2026.
//

#include "mlink/control_server.hpp"
#include <sockpp/inet_address.h>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <sys/socket.h>

namespace mlink {

    ControlServer::ControlServer(std::function<nlohmann::json(const std::string&)> command_handler,
                                 uint16_t port)
        : port_(port)
        , acceptor_(std::make_unique<sockpp::tcp_acceptor>())
        , on_recv_(std::move(command_handler)) {}

    ControlServer::~ControlServer() {
        stop();
    }

    void ControlServer::open() {
        sockpp::inet_address addr("127.0.0.1", port_);
        
        auto result = acceptor_->open(addr, 5, sockpp::tcp_acceptor::REUSE);
        if (!result.is_ok()) {
            throw std::runtime_error("Failed to bind control port " + std::to_string(port_) +
                                     ": " + result.error_message());
        }

        port_ = sockpp::inet_address(acceptor_->address()).port();
        running_ = true;
        std::cout << "MouseLink control server listening on 127.0.0.1:" << port_ << std::endl;
    }

    void ControlServer::serve() {
        while (running_) {
            auto client = acceptor_->accept();
            
            if (!client.is_ok()) {
                if (running_) {
                    std::cerr << "Failed to accept control client: " << client.error_message() << std::endl;
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                continue;
            }

            auto done = std::make_shared<std::atomic<bool>>(false);
            std::lock_guard<std::mutex> lock(clients_mutex_);
            reap_clients();
            clients_.push_back(ClientThread{
                std::thread(&ControlServer::process_client, this, client.release(), done),
                done
            });
        }
    }

    void ControlServer::start() {
        open();
        serve();
    }

    void ControlServer::stop() {
        running_ = false;
        bool was_open = acceptor_ && acceptor_->is_open();
        if (was_open) {
            acceptor_->shutdown(SHUT_RDWR);
        }

        std::list<ClientThread> clients;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            clients.swap(clients_);
        }
        for (auto& c : clients) {
            if (c.thread.joinable() && c.thread.get_id() != std::this_thread::get_id()) {
                c.thread.join();
            } else if (c.thread.joinable()) {
                c.thread.detach();
            }
        }

        if (was_open) {
            acceptor_->close();
        }
    }

    void ControlServer::interrupt() {
        running_ = false;
        if (acceptor_) {
            ::shutdown(acceptor_->handle(), SHUT_RDWR);
        }
    }

    void ControlServer::process_client(sockpp::tcp_socket client, std::shared_ptr<std::atomic<bool>> done) {
        client.read_timeout(std::chrono::seconds(5));

        std::string pending;
        char buffer[1024];
        
        while (running_) {
            auto read_result = client.read(buffer, sizeof(buffer));
            
            if (!read_result.is_ok() || read_result.value() == 0) {
                // Client disconnected, timed out or errored
                break;
            }
            
            pending.append(buffer, read_result.value());

            bool keep_open = true;
            while (keep_open) {
                auto [command, found] = take_line(pending);
                if (!found) {
                    break;
                }

                nlohmann::json response = on_recv_(command);
                std::string response_str = response.dump() + "\n";
                auto write_result = client.write(response_str);
                if (!write_result.is_ok()) {
                    std::cerr << "Failed to send control response: " << write_result.error_message() << std::endl;
                    keep_open = false;
                }
            }
            if (!keep_open) {
                break;
            }

            if (pending.size() > MAX_CONTROL_LINE) {
                nlohmann::json response = {
                    {"CMD", "unknown"},
                    {"result", nullptr},
                    {"error", "Command too long"}
                };
                client.write(response.dump() + "\n");
                break;
            }
        }
        
        client.close();
        *done = true;
    }

    std::pair<std::string, bool> ControlServer::take_line(std::string& buffer) {
        size_t newline_pos = buffer.find('\n');
        if (newline_pos == std::string::npos) {
            return {"", false};
        }
        
        std::string line = buffer.substr(0, newline_pos + 1);
        buffer.erase(0, newline_pos + 1);
        return {line, true};
    }

    void ControlServer::reap_clients() {
        for (auto it = clients_.begin(); it != clients_.end();) {
            if (*it->done) {
                if (it->thread.joinable()) {
                    it->thread.join();
                }
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }

} // namespace mlink
