#include "UdpSocketHandler.hpp"

namespace sg {
UdpSocketHandler::UdpSocketHandler() {}

UdpSocketHandler::~UdpSocketHandler() {
  lock_guard<std::recursive_mutex> guard(mutex);
  for (int fd : activeSockets) {
    VLOG(1) << "Closing leaked socket " << fd;
    ::close(fd);
  }
  activeSockets.clear();
}

addrinfo* UdpSocketHandler::resolve(const SocketEndpoint& endpoint,
                                    bool passive) {
  addrinfo* results = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_DGRAM;
  hints.ai_flags = passive ? AI_PASSIVE : AI_ADDRCONFIG;
  string portname = std::to_string(std::max(0, endpoint.getPort()));
  const char* hostname =
      endpoint.getName().empty() ? NULL : endpoint.getName().c_str();

  int rc = getaddrinfo(hostname, portname.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(WARNING) << "Error getting address info for " << endpoint << ": " << rc
                 << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return NULL;
  }
  return results;
}

int UdpSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(mutex);
  addrinfo* results = resolve(endpoint, false);
  if (results == NULL) {
    return -1;
  }
  int sockFd = -1;
  for (addrinfo* p = results; p != NULL; p = p->ai_next) {
    sockFd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (sockFd == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << errno << " "
                << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    break;
  }
  freeaddrinfo(results);
  if (sockFd != -1) {
    VLOG(1) << "Datagram socket " << sockFd << " targets " << endpoint;
    activeSockets.insert(sockFd);
  }
  return sockFd;
}

int UdpSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(mutex);
  addrinfo* results = resolve(endpoint, true);
  if (results == NULL) {
    return -1;
  }
  int sockFd = -1;
  for (addrinfo* p = results; p != NULL; p = p->ai_next) {
    sockFd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (sockFd == -1) {
      continue;
    }
    int flag = 1;
    FATAL_FAIL(::setsockopt(sockFd, SOL_SOCKET, SO_REUSEADDR, &flag,
                            sizeof(int)));
    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      LOG(INFO) << "Error binding " << endpoint << ": " << errno << " "
                << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    break;
  }
  freeaddrinfo(results);
  if (sockFd != -1) {
    activeSockets.insert(sockFd);
  }
  return sockFd;
}

int UdpSocketHandler::getLocalPort(int fd) {
  sockaddr_storage addr;
  socklen_t len = sizeof(addr);
  FATAL_FAIL(::getsockname(fd, (sockaddr*)&addr, &len));
  if (addr.ss_family == AF_INET6) {
    return ntohs(((sockaddr_in6*)&addr)->sin6_port);
  }
  return ntohs(((sockaddr_in*)&addr)->sin_port);
}

bool UdpSocketHandler::waitForData(int fd, int timeoutMs) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int rc = ::poll(&pfd, 1, timeoutMs);
  if (rc == -1) {
    if (GetErrno() == EINTR) {
      return false;
    }
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());
  }
  return rc > 0 && (pfd.revents & (POLLIN | POLLERR)) != 0;
}

ssize_t UdpSocketHandler::send(int fd, const void* buf, size_t count) {
  return ::send(fd, buf, count, MSG_NOSIGNAL);
}

ssize_t UdpSocketHandler::sendTo(int fd, const void* buf, size_t count,
                                 const SocketEndpoint& endpoint) {
  addrinfo* results = resolve(endpoint, false);
  if (results == NULL) {
    SetErrno(EHOSTUNREACH);
    return -1;
  }
  ssize_t rc =
      ::sendto(fd, buf, count, MSG_NOSIGNAL, results->ai_addr,
               results->ai_addrlen);
  freeaddrinfo(results);
  return rc;
}

ssize_t UdpSocketHandler::receiveFrom(int fd, void* buf, size_t count,
                                      SocketEndpoint* from) {
  sockaddr_storage addr;
  socklen_t len = sizeof(addr);
  ssize_t rc = ::recvfrom(fd, buf, count, 0, (sockaddr*)&addr, &len);
  if (rc >= 0 && from) {
    char host[NI_MAXHOST];
    char service[NI_MAXSERV];
    if (getnameinfo((sockaddr*)&addr, len, host, sizeof(host), service,
                    sizeof(service), NI_NUMERICHOST | NI_NUMERICSERV) == 0) {
      *from = SocketEndpoint(host, atoi(service));
    }
  }
  return rc;
}

void UdpSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> guard(mutex);
  if (activeSockets.erase(fd) == 0) {
    LOG(INFO) << "Tried to close a socket that isn't active: " << fd;
    return;
  }
  VLOG(1) << "Closing datagram socket " << fd;
  FATAL_FAIL(::close(fd));
}
}  // namespace sg
