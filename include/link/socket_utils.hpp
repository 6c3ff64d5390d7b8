#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace durin {

bool connectTcp(const std::string& host, int port, int timeout_ms, int& out_fd, std::string& error);
bool bindUdp(const std::string& host, int port, int& out_fd, std::string& error);
bool listenTcp(const std::string& host, int port, int backlog, int& out_fd, std::string& error);
bool setNonBlocking(int fd, std::string& error);

enum class SendOutcome {
    Sent,
    WouldBlock,  // nothing written, socket buffer full
    Failed,
};

// Writes one whole message on a non-blocking socket. Returns WouldBlock
// without writing anything when the first byte does not fit; once part of the
// message is out, waits on POLLOUT in poll_ms slices until the rest follows
// or the socket fails.
SendOutcome sendMessage(int fd, const uint8_t* data, std::size_t size, int poll_ms);

// SO_SNDBUF; bytes <= 0 keeps the kernel default.
bool setSendBuffer(int fd, int bytes, std::string& error);

// Port the kernel actually bound, useful after binding port 0.
uint16_t localPort(int fd);

// Wakes threads blocked on fd without releasing the descriptor number.
void shutdownSocket(int fd);
void closeSocket(int& fd);

// Source address the kernel would use to reach peer; 127.0.0.1 when unknown.
std::string guessLocalIpv4(const std::string& peer);

}  // namespace durin
