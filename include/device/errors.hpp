#pragma once

#include <stdexcept>
#include <string>

namespace kth_logger::device {

// Every device-side failure is fatal to the run.
class DeviceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class TransportError : public DeviceError {
 public:
  using DeviceError::DeviceError;
};

class IdentificationError : public DeviceError {
 public:
  using DeviceError::DeviceError;
};

class ShortReadError : public DeviceError {
 public:
  using DeviceError::DeviceError;
};

}  // namespace kth_logger::device
