#include "unit_parser.hpp"

#include <charconv>
#include <sstream>
#include <string>

namespace hostreg::discovery {

namespace {

constexpr std::string_view kServiceSuffix = ".service";

std::vector<std::string> Tokenize(const std::string& line) {
  std::istringstream       in(line);
  std::vector<std::string> tokens;
  std::string              token;
  while (in >> token) {
    tokens.push_back(std::move(token));
  }
  return tokens;
}

bool IsStatusBullet(const std::string& token) {
  return token == "\xe2\x97\x8f" || token == "*";
}

bool IsServiceName(const std::string& name) {
  return name.size() > kServiceSuffix.size() && name.ends_with(kServiceSuffix);
}

} // namespace

std::vector<hostreg::model::ObservedUnit> ParseUnitList(std::string_view text) {
  std::vector<hostreg::model::ObservedUnit> units;

  std::istringstream in{std::string(text)};
  std::string        line;
  while (std::getline(in, line)) {
    auto tokens = Tokenize(line);
    if (!tokens.empty() && IsStatusBullet(tokens.front())) {
      tokens.erase(tokens.begin());
    }
    if (tokens.size() < 4) {
      continue;
    }
    if (!IsServiceName(tokens[0])) {
      continue;
    }

    hostreg::model::ObservedUnit unit;
    unit.name      = tokens[0];
    unit.run_state = tokens[2];
    for (std::size_t i = 4; i < tokens.size(); ++i) {
      if (i > 4) unit.description.push_back(' ');
      unit.description += tokens[i];
    }
    units.push_back(std::move(unit));
  }

  return units;
}

std::optional<hostreg::model::Pid> ParseMainPid(std::string_view text) {
  constexpr std::string_view kKey = "MainPID=";

  const auto pos = text.find(kKey);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }

  const char*        begin = text.data() + pos + kKey.size();
  const char*        end   = text.data() + text.size();
  hostreg::model::Pid pid   = 0;
  const auto [ptr, ec]     = std::from_chars(begin, end, pid);
  if (ec != std::errc{} || ptr == begin || pid <= 0) {
    return std::nullopt;
  }
  return pid;
}

} // namespace hostreg::discovery
