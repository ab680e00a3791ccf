/*************************************************************************
 * @file SerialLink.h
 * @date 2026/10/19
 *
 ************************************************************************/

#ifndef PDL_SERIAL_LINK_H
#define PDL_SERIAL_LINK_H

/*************************************************************************
 * Includes
 ************************************************************************/
#include <atomic>
#include <stdint.h>
#include <string>
#include <vector>

#include "Config.h"
#include "Link.h"

/*************************************************************************
 * Class
 ************************************************************************/
// Link over a POSIX tty (USB CDC, FTDI, or a pty in tests). Raw 8N1, no flow control.
// A device that disappears (EIO/ENXIO, hang-up) closes the link: the failing request
// and every later one return NotOpen and isOpen() turns false.
class SerialLink : public Link {
public:
  explicit SerialLink(uint32_t baud = PDL_DEFAULT_BAUD,
                      uint32_t timeout_ms = PDL_LINK_TIMEOUT_MS);
  ~SerialLink() override;

  SerialLink(const SerialLink&) = delete;
  SerialLink& operator=(const SerialLink&) = delete;

  LinkError open(const std::string& port) override;
  void close() override;
  bool isOpen() const override { return fd >= 0; }

  // Drops stale input, writes the request byte, then collects one '\n'-terminated
  // line until the timeout expires.
  LinkError readVoltage(Channel ch, float& volts) override;

  // Candidate boards under `dev_dir`: ttyACM* (USB CDC) and ttyUSB* (USB-serial
  // bridges), as full paths in name order.
  static std::vector<std::string> listPorts(const std::string& dev_dir = "/dev");

  inline const std::string& portName() const { return port_name; }
  inline uint32_t timeoutMs() const { return timeout_ms; }

  // Parses a decimal reply line ("2.503", "2.503\r", "-1e-3"). Exposed for tests.
  static bool parseVoltageLine(const std::string& line, float& volts);

private:
  bool configurePort(int h);
  LinkError readLine(int h, std::string& line);
  LinkError dropDevice(const char* what, int err);

  std::atomic<int> fd {-1};   // closed by the sampler thread on device loss
  uint32_t         baud;
  uint32_t         timeout_ms;
  std::string      port_name;
};

#endif // PDL_SERIAL_LINK_H
