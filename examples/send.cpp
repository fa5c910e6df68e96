// examples/send.cpp
// Send one notification through the sandbox gateway.
//
//   cmake -B build -DPUSHGATE_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/pushgate_send <device-token> cert.pem key.pem
//
// Override gateway:
//
//   PUSHGATE_GATEWAY=gateway.push.apple.com:2195 ./build/pushgate_send ...
//
// The gateway only answers failures, so the program waits a few seconds
// for an error response before closing.

#include "pushgate/pushgate.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0] << " <device-token> <cert.pem> <key.pem>" << std::endl;
        return 2;
    }

    std::string gateway = pushgate::kSandboxGateway;
    if (const char* env = std::getenv("PUSHGATE_GATEWAY")) {
        gateway = env;
    }

    try {
        auto client = pushgate::Client::create(
            pushgate::ClientConfig::builder(gateway)
                .certificate_files(argv[2], argv[3])
                .on_failure([](const pushgate::DeliveryFailure& f) {
                    std::cerr << "  !! identifier " << f.notification->identifier()
                              << ": " << f.reason << std::endl;
                })
                .build());

        auto notification = std::make_shared<pushgate::Notification>(
            argv[1],
            pushgate::Payload()
                .alert("Hello from pushgate")
                .badge(1)
                .sound("default")
                .custom(pushgate::Fields().add("sent_by", "examples/send")));
        notification->expiry(static_cast<uint32_t>(std::time(nullptr) + 3600));

        client->send(notification);
        std::cout << "  -> sent identifier " << notification->identifier() << std::endl;

        std::this_thread::sleep_for(std::chrono::seconds(3));
        client->close();
    } catch (const pushgate::PushError& e) {
        std::cerr << "  !! " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
