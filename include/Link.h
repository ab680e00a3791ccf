/*************************************************************************
 * @file Link.h
 * @date 2026/10/19
 *
 ************************************************************************/

#ifndef PDL_LINK_H
#define PDL_LINK_H

/*************************************************************************
 * Includes
 ************************************************************************/
#include <string>

#include "Record.h"

/*************************************************************************
 * Types
 ************************************************************************/
enum class LinkError : uint8_t {
  Ok = 0,
  PortUnavailable,
  AlreadyOpen,
  NotOpen,
  Timeout,
  MalformedResponse,
};

const char* linkErrorName(LinkError e);

/*************************************************************************
 * Class
 ************************************************************************/
// Request/response connection to the acquisition firmware.
// Implementations are not thread-safe; the Sampler serializes access.
class Link {
public:
  virtual ~Link() = default;

  virtual LinkError open(const std::string& port) = 0;

  // Idempotent
  virtual void close() = 0;

  virtual bool isOpen() const = 0;

  // Sends the channel's request code and waits for one reply line.
  // No retries: a failed request is reported as-is.
  virtual LinkError readVoltage(Channel ch, float& volts) = 0;
};

#endif // PDL_LINK_H
