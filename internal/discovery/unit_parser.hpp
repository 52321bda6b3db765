#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "internal/model/observation.hpp"

namespace hostreg::discovery {

/*
  Parses `systemctl list-units --type=service --all --no-pager --plain`.

    UNIT            LOAD   ACTIVE   SUB     DESCRIPTION
    nginx.service   loaded active   running A high performance web server

  - lines with fewer than 4 whitespace tokens are dropped
  - token 1 is the unit name, token 3 the run state, tokens 5.. the description
  - the heading and legend/footer rows are dropped (name is not *.service)
  - a leading status bullet ("●" or "*") is ignored
  Output order follows the input.
*/
std::vector<hostreg::model::ObservedUnit> ParseUnitList(std::string_view text);

/*
  Parses `systemctl show <unit> --property=MainPID`.
  MainPID=0, a missing property or a malformed value all mean "no process".
*/
std::optional<hostreg::model::Pid> ParseMainPid(std::string_view text);

} // namespace hostreg::discovery
