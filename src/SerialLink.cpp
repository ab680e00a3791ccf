/************************************************************************
 * @file SerialLink.cpp
 * @brief Serial request/response link to the acquisition firmware
 *
 * Protocol: the host sends 'a' (pressure) or 'b' (displacement), the
 * board answers with the channel voltage as text followed by '\n'.
 ************************************************************************/

#include "SerialLink.h"
#include "Log.h"

#include <algorithm>
#include <chrono>
#include <ctype.h>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <math.h>
#include <poll.h>
#include <stdlib.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

static const char* TAG_LINK = "LINK";

const char* linkErrorName(LinkError e) {
  switch (e) {
    case LinkError::Ok:                return "Ok";
    case LinkError::PortUnavailable:   return "PortUnavailable";
    case LinkError::AlreadyOpen:       return "AlreadyOpen";
    case LinkError::NotOpen:           return "NotOpen";
    case LinkError::Timeout:           return "Timeout";
    case LinkError::MalformedResponse: return "MalformedResponse";
  }
  return "Unknown";
}

static bool baudToSpeed(uint32_t baud, speed_t& out) {
  switch (baud) {
    case 1200:   out = B1200;   return true;
    case 2400:   out = B2400;   return true;
    case 4800:   out = B4800;   return true;
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
    case 230400: out = B230400; return true;
    case 460800: out = B460800; return true;
    case 921600: out = B921600; return true;
    default: return false;
  }
}

// ----- ctor / dtor -----
SerialLink::SerialLink(uint32_t baud, uint32_t timeout_ms)
: baud(baud),
  timeout_ms(timeout_ms) {}

SerialLink::~SerialLink() {
  close();
}

// ----- open / close -----
LinkError SerialLink::open(const std::string& port) {
  if (fd >= 0) {
    pdlLog(TAG_LINK)->warn("open({}) refused: {} already open", port, port_name);
    return LinkError::AlreadyOpen;
  }

  const int h = ::open(port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (h < 0) {
    pdlLog(TAG_LINK)->error("cannot open {}: {}", port, strerror(errno));
    return LinkError::PortUnavailable;
  }
  if (!configurePort(h)) {
    ::close(h);
    return LinkError::PortUnavailable;
  }

  port_name = port;
  fd = h;
  pdlLog(TAG_LINK)->info("opened {} @ {} baud, timeout {} ms", port, baud, timeout_ms);
  return LinkError::Ok;
}

void SerialLink::close() {
  const int h = fd.exchange(-1);
  if (h >= 0) {
    ::close(h);
    pdlLog(TAG_LINK)->info("closed {}", port_name);
  }
  port_name.clear();
}

// Device gone (unplugged, pty master closed): release the handle so the
// next request and isOpen() report it.
LinkError SerialLink::dropDevice(const char* what, int err) {
  const int h = fd.exchange(-1);
  if (h >= 0) {
    ::close(h);
    pdlLog(TAG_LINK)->error("{} lost ({}: {})", port_name, what, err ? strerror(err) : "hang-up");
  }
  return LinkError::NotOpen;
}

static bool deviceGone(int err) {
  return err == EIO || err == ENXIO || err == ENODEV || err == EBADF;
}

bool SerialLink::configurePort(int h) {
  speed_t speed;
  if (!baudToSpeed(baud, speed)) {
    pdlLog(TAG_LINK)->error("unsupported baud rate {}", baud);
    return false;
  }

  struct termios tio;
  if (tcgetattr(h, &tio) != 0) {
    pdlLog(TAG_LINK)->error("not a serial device: {}", strerror(errno));
    return false;
  }
  cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~(CSTOPB | PARENB);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);
  if (tcsetattr(h, TCSANOW, &tio) != 0) {
    pdlLog(TAG_LINK)->error("tcsetattr failed: {}", strerror(errno));
    return false;
  }
  tcflush(h, TCIOFLUSH);
  return true;
}

// ----- request / response -----
LinkError SerialLink::readVoltage(Channel ch, float& volts) {
  const int h = fd;
  if (h < 0) return LinkError::NotOpen;

  // A reply that missed the previous deadline must not answer this request
  if (tcflush(h, TCIFLUSH) != 0 && deviceGone(errno)) return dropDevice("flush", errno);

  const char code = channelRequestCode(ch);
  ssize_t n = ::write(h, &code, 1);
  if (n != 1) {
    const int err = (n < 0) ? errno : 0;
    if (deviceGone(err)) return dropDevice("write", err);
    pdlLog(TAG_LINK)->warn("write '{}' failed: {}", code, n < 0 ? strerror(err) : "short write");
    return LinkError::Timeout;
  }
  tcdrain(h);

  std::string line;
  LinkError e = readLine(h, line);
  if (e != LinkError::Ok) {
    pdlLog(TAG_LINK)->debug("'{}' -> {}", code, linkErrorName(e));
    return e;
  }
  if (!parseVoltageLine(line, volts)) {
    pdlLog(TAG_LINK)->debug("'{}' -> unparsable reply \"{}\"", code, line);
    return LinkError::MalformedResponse;
  }
  return LinkError::Ok;
}

LinkError SerialLink::readLine(int h, std::string& line) {
  using clock = std::chrono::steady_clock;
  const clock::time_point deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

  line.clear();
  while (true) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
    if (left.count() <= 0) return LinkError::Timeout;

    struct pollfd pfd;
    pfd.fd = h;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int r = ::poll(&pfd, 1, (int)left.count());
    if (r < 0) {
      if (errno == EINTR) continue;
      pdlLog(TAG_LINK)->error("poll failed: {}", strerror(errno));
      return LinkError::Timeout;
    }
    if (r == 0) return LinkError::Timeout;
    if (pfd.revents & POLLNVAL) return dropDevice("poll", EBADF);
    if (!(pfd.revents & POLLIN)) {
      // POLLHUP / POLLERR without data
      return dropDevice("poll", 0);
    }

    char buf[32];
    ssize_t n = ::read(h, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      if (deviceGone(errno)) return dropDevice("read", errno);
      pdlLog(TAG_LINK)->error("read failed: {}", strerror(errno));
      return LinkError::Timeout;
    }
    if (n == 0) {
      if (pfd.revents & POLLHUP) return dropDevice("read", 0);
      continue;
    }
    for (ssize_t i = 0; i < n; ++i) {
      if (buf[i] == '\n') return LinkError::Ok;   // bytes after the terminator are dropped
      line.push_back(buf[i]);
      if (line.size() > PDL_LINE_MAX) return LinkError::MalformedResponse;
    }
  }
}

bool SerialLink::parseVoltageLine(const std::string& line, float& volts) {
  size_t b = 0, e = line.size();
  while (b < e && isspace((unsigned char)line[b])) ++b;
  while (e > b && isspace((unsigned char)line[e - 1])) --e;
  if (b == e) return false;

  const std::string s = line.substr(b, e - b);
  // decimal text only: strtof would also take hex floats, "inf" and "nan"
  for (char c : s) {
    if (!isdigit((unsigned char)c) && c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E') {
      return false;
    }
  }
  char* end = nullptr;
  errno = 0;
  float v = strtof(s.c_str(), &end);
  if (end != s.c_str() + s.size() || errno == ERANGE || !isfinite(v)) return false;
  volts = v;
  return true;
}

// ----- port discovery -----
std::vector<std::string> SerialLink::listPorts(const std::string& dev_dir) {
  std::vector<std::string> ports;
  DIR* dir = opendir(dev_dir.c_str());
  if (!dir) {
    pdlLog(TAG_LINK)->warn("cannot scan {}: {}", dev_dir, strerror(errno));
    return ports;
  }
  while (struct dirent* ent = readdir(dir)) {
    const std::string name = ent->d_name;
    if (name.compare(0, 6, "ttyACM") == 0 || name.compare(0, 6, "ttyUSB") == 0) {
      ports.push_back(dev_dir + "/" + name);
    }
  }
  closedir(dir);
  std::sort(ports.begin(), ports.end());
  return ports;
}
