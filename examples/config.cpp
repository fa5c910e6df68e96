// Full ClientConfig builder: all available options with defaults.
//
//   cmake -B build -DPUSHGATE_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/pushgate_config

#include "pushgate/pushgate.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>

int main() {
    auto logger = spdlog::stdout_color_mt("push");
    logger->set_level(spdlog::level::debug);

    auto config = pushgate::ClientConfig::builder(pushgate::kSandboxGateway)  // or kProductionGateway
        .certificate_files("cert.pem", "key.pem")                  // or certificate_pem(cert, key)
        .ca_file("")                                               // default: system trust store
        .replay_capacity(10000)                                    // default: 10000 in flight
        .network_timeout(std::chrono::milliseconds(60000))         // default: 60s dial/handshake/write
        .report_queue_size(10)                                     // default: 10 pending reports
        .on_failure([](const pushgate::DeliveryFailure& f) {       // default: failures are only logged
            std::cerr << "[push] " << f.reason << std::endl;
        })
        .logger(logger)                                            // default: "pushgate" on stderr
        .build();

    auto client = pushgate::Client::create(std::move(config));
    client->close();
}
