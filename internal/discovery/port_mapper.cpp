#include "port_mapper.hpp"

#include <cctype>
#include <charconv>
#include <optional>
#include <sstream>
#include <string>

namespace hostreg::discovery {

namespace {

std::optional<std::int64_t> ParseDigits(std::string_view digits) {
  if (digits.empty() || digits.size() > 10) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

// "0.0.0.0:80", "[::]:8080", "*:443", "127.0.0.53%lo:53" -> port
std::optional<std::int64_t> PortOfAddressToken(std::string_view token) {
  const auto colon = token.rfind(':');
  if (colon == std::string_view::npos || colon == 0) {
    return std::nullopt;
  }
  return ParseDigits(token.substr(colon + 1));
}

std::optional<std::int64_t> FirstPid(std::string_view line) {
  constexpr std::string_view kKey = "pid=";

  auto pos = line.find(kKey);
  while (pos != std::string_view::npos) {
    // skip "ppid=" and similar
    if (pos == 0 || !std::isalnum(static_cast<unsigned char>(line[pos - 1]))) {
      const auto start = pos + kKey.size();
      auto       end   = start;
      while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) ++end;
      if (auto pid = ParseDigits(line.substr(start, end - start))) {
        return pid;
      }
    }
    pos = line.find(kKey, pos + 1);
  }
  return std::nullopt;
}

} // namespace

std::vector<hostreg::model::PortBinding> ParseListeningSockets(std::string_view text) {
  std::vector<hostreg::model::PortBinding> bindings;

  std::istringstream in{std::string(text)};
  std::string        line;
  while (std::getline(in, line)) {
    std::optional<std::int64_t> port;

    std::istringstream tokens(line);
    std::string        token;
    while (!port && tokens >> token) {
      port = PortOfAddressToken(token);
    }

    const auto pid = FirstPid(line);
    if (!port || !pid) {
      continue;
    }
    if (*port < 1 || *port > 65535 || *pid <= 0) {
      continue;
    }

    bindings.push_back({static_cast<std::uint16_t>(*port), static_cast<hostreg::model::Pid>(*pid)});
  }

  return bindings;
}

std::vector<hostreg::model::PortBinding> PortsForPid(const std::vector<hostreg::model::PortBinding>& bindings, hostreg::model::Pid pid) {
  std::vector<hostreg::model::PortBinding> out;
  for (const auto& binding : bindings) {
    if (binding.owner_pid == pid) {
      out.push_back(binding);
    }
  }
  return out;
}

PortMap::PortMap(const std::vector<hostreg::model::PortBinding>& bindings) : binding_count_(bindings.size()) {
  for (const auto& binding : bindings) {
    by_pid_[binding.owner_pid].push_back(binding.port);
  }
}

const std::vector<std::uint16_t>& PortMap::PortsFor(hostreg::model::Pid pid) const {
  static const std::vector<std::uint16_t> kNone;

  const auto it = by_pid_.find(pid);
  if (it == by_pid_.end()) {
    return kNone;
  }
  return it->second;
}

} // namespace hostreg::discovery
