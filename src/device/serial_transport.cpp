#include "device/serial_transport.hpp"

#include <fcntl.h>
#include <glob.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include "device/errors.hpp"

namespace kth_logger::device {
namespace {

struct BaudEntry {
  std::uint32_t rate;
  speed_t speed;
};

constexpr BaudEntry kBaudTable[] = {
    {1200, B1200},     {2400, B2400},     {4800, B4800},     {9600, B9600},       {19200, B19200},
    {38400, B38400},   {57600, B57600},   {115200, B115200}, {230400, B230400},   {460800, B460800},
    {921600, B921600},
};

bool lookup_speed(const std::uint32_t baud_rate, speed_t& speed) noexcept {
  for (const auto& entry : kBaudTable) {
    if (entry.rate == baud_rate) {
      speed = entry.speed;
      return true;
    }
  }
  return false;
}

tcflag_t char_size_flag(const std::uint8_t byte_size) {
  switch (byte_size) {
    case 5:
      return CS5;
    case 6:
      return CS6;
    case 7:
      return CS7;
    case 8:
      return CS8;
    default:
      throw TransportError("unsupported byte size " + std::to_string(byte_size));
  }
}

std::string errno_message(const std::string& what, const std::string& port) {
  return what + " " + port + ": " + std::strerror(errno);
}

void append_glob(const char* pattern, std::vector<std::string>& out) {
  glob_t matches{};
  if (::glob(pattern, 0, nullptr, &matches) == 0) {
    for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
      out.emplace_back(matches.gl_pathv[i]);
    }
  }
  ::globfree(&matches);
}

}  // namespace

SerialConnection::SerialConnection(const SerialOptions& options) : port_(options.port), timeout_(options.timeout) {
  fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
  if (fd_ < 0) {
    throw TransportError(errno_message("cannot open serial port", port_));
  }

  try {
    configure(options);
  } catch (...) {
    ::close(fd_);
    fd_ = -1;
    throw;
  }
}

SerialConnection::~SerialConnection() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void SerialConnection::configure(const SerialOptions& options) {
  speed_t speed = B9600;
  if (!lookup_speed(options.baud_rate, speed)) {
    throw TransportError("unsupported baud rate " + std::to_string(options.baud_rate));
  }

  termios tty{};
  if (::tcgetattr(fd_, &tty) != 0) {
    throw TransportError(errno_message("tcgetattr failed on", port_));
  }

  ::cfmakeraw(&tty);
  ::cfsetispeed(&tty, speed);
  ::cfsetospeed(&tty, speed);

  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_cflag &= ~(CSIZE | PARENB | CRTSCTS);
  tty.c_cflag |= char_size_flag(options.byte_size);
  if (options.stop_bits == 2) {
    tty.c_cflag |= CSTOPB;
  } else if (options.stop_bits == 1) {
    tty.c_cflag &= ~CSTOPB;
  } else {
    throw TransportError("unsupported stop bits " + std::to_string(options.stop_bits));
  }
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  // Reads are bounded by poll(), not by VTIME.
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
    throw TransportError(errno_message("tcsetattr failed on", port_));
  }
  ::tcflush(fd_, TCIOFLUSH);
}

std::vector<std::uint8_t> SerialConnection::send_and_receive(const std::uint8_t command,
                                                             const std::size_t expected_length) {
  for (;;) {
    const ssize_t written = ::write(fd_, &command, 1);
    if (written == 1) {
      break;
    }
    if (written < 0 && errno == EINTR) {
      continue;
    }
    throw TransportError(errno_message("write failed on", port_));
  }

  if (::tcdrain(fd_) != 0) {
    throw TransportError(errno_message("tcdrain failed on", port_));
  }

  std::vector<std::uint8_t> response(expected_length);
  std::size_t received = 0;
  const auto deadline = std::chrono::steady_clock::now() + timeout_;

  while (received < expected_length) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      break;
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw TransportError(errno_message("poll failed on", port_));
    }
    if (ready == 0) {
      break;
    }
    if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0 && (pfd.revents & POLLIN) == 0) {
      throw TransportError("serial port " + port_ + " hung up");
    }

    const ssize_t bytes_read = ::read(fd_, response.data() + received, expected_length - received);
    if (bytes_read < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      throw TransportError(errno_message("read failed on", port_));
    }
    if (bytes_read == 0) {
      // Device unplugged: a ready fd that returns 0 bytes never recovers.
      throw TransportError("serial port " + port_ + " returned end of file");
    }
    received += static_cast<std::size_t>(bytes_read);
  }

  response.resize(received);
  return response;
}

SerialTransport::SerialTransport(SerialOptions options) : options_(std::move(options)) {}

std::unique_ptr<Connection> SerialTransport::open() { return std::make_unique<SerialConnection>(options_); }

const SerialOptions& SerialTransport::options() const noexcept { return options_; }

bool is_supported_baud_rate(const std::uint32_t baud_rate) noexcept {
  speed_t speed = B0;
  return lookup_speed(baud_rate, speed);
}

std::vector<std::string> list_serial_ports() {
  std::vector<std::string> ports;
  append_glob("/dev/serial/by-id/*", ports);
  append_glob("/dev/ttyUSB*", ports);
  append_glob("/dev/ttyACM*", ports);
  return ports;
}

}  // namespace kth_logger::device
