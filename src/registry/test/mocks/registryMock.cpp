/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

// Stands in for "registry serve <config>": listens on the configured port
// until SIGTERM. REGISTRY_MOCK_BEHAVIOUR selects a failure to simulate.

static int readPort(const char* configFile) {
    std::ifstream is{configFile};
    std::string line;
    while(std::getline(is, line)) {
        auto position = line.find("addr: :");
        if(position != std::string::npos) {
            return std::stoi(line.substr(position + std::strlen("addr: :")));
        }
    }
    return -1;
}

static int listenOn(int port) {
    auto fd = socket(AF_INET, SOCK_STREAM, 0);
    if(fd == -1) {
        return -1;
    }
    int enable = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if(bind(fd, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) != 0
       || listen(fd, 128) != 0) {
        close(fd);
        return -1;
    }
    return fd;
}

int main(int argc, char* argv[]) {
    if(argc != 3 || std::string{argv[1]} != "serve") {
        std::cerr << "usage: registryMock serve <config>" << std::endl;
        return 1;
    }

    const char* variable = std::getenv("REGISTRY_MOCK_BEHAVIOUR");
    auto behaviour = std::string{variable ? variable : ""};
    if(behaviour == "exit-immediately") {
        std::cerr << "registry mock exiting immediately" << std::endl;
        return 2;
    }

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGTERM);
    if(behaviour == "ignore-sigterm") {
        signal(SIGTERM, SIG_IGN);
    }
    else {
        sigprocmask(SIG_BLOCK, &signals, nullptr);
    }

    if(behaviour == "never-listen") {
        int received = 0;
        sigwait(&signals, &received);
        return 0;
    }

    auto port = readPort(argv[2]);
    auto fd = port > 0 ? listenOn(port) : -1;
    if(fd == -1) {
        std::cerr << "registry mock failed to listen on port " << port << std::endl;
        return 1;
    }
    std::cout << "registry mock listening on port " << port << std::endl;

    if(behaviour == "crash-after-listen") {
        usleep(300 * 1000);
        close(fd);
        return 3;
    }
    if(behaviour == "ignore-sigterm") {
        while(true) {
            pause();
        }
    }

    int received = 0;
    sigwait(&signals, &received);
    close(fd);
    std::cout << "registry mock received signal " << received << std::endl;
    return 0;
}
