#include "internal/discovery/port_mapper.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using hostreg::discovery::IsWebPort;
using hostreg::discovery::ParseListeningSockets;
using hostreg::discovery::PortMap;
using hostreg::discovery::PortsForPid;
using hostreg::model::PortBinding;

const char* kSsOutput =
    "State  Recv-Q Send-Q Local Address:Port  Peer Address:Port Process\n"
    "LISTEN 0      511          0.0.0.0:80         0.0.0.0:*     users:((\"nginx\",pid=1234,fd=6),(\"nginx\",pid=1235,fd=6))\n"
    "LISTEN 0      128          0.0.0.0:22         0.0.0.0:*     users:((\"sshd\",pid=5678,fd=3))\n"
    "LISTEN 0      4096            [::]:8080          [::]:*     users:((\"app\",pid=99,fd=3))\n"
    "LISTEN 0      4096   127.0.0.53%lo:53         0.0.0.0:*\n"
    "LISTEN 0      511             [::]:443           [::]:*     users:((\"nginx\",pid=1234,fd=7))\n";

void TestIsWebPort() {
  assert(IsWebPort(80));
  assert(IsWebPort(443));
  assert(IsWebPort(3000));
  assert(IsWebPort(3999));
  assert(IsWebPort(4500));
  assert(IsWebPort(5999));
  assert(IsWebPort(8000));
  assert(IsWebPort(8999));

  assert(!IsWebPort(0));
  assert(!IsWebPort(-80));
  assert(!IsWebPort(22));
  assert(!IsWebPort(2999));
  assert(!IsWebPort(6000));
  assert(!IsWebPort(7999));
  assert(!IsWebPort(9000));
  assert(!IsWebPort(65536));
  assert(!IsWebPort(70080));
}

void TestParsesListenersWithOwners() {
  const auto bindings = ParseListeningSockets(kSsOutput);

  // header and the process-less resolver socket are skipped
  assert(bindings.size() == 4);
  assert((bindings[0] == PortBinding{80, 1234}));
  assert((bindings[1] == PortBinding{22, 5678}));
  assert((bindings[2] == PortBinding{8080, 99}));
  assert((bindings[3] == PortBinding{443, 1234}));
}

void TestOutOfRangePortsAreSkipped() {
  const auto bindings = ParseListeningSockets(
      "LISTEN 0 1 0.0.0.0:70000 0.0.0.0:* users:((\"x\",pid=1,fd=1))\n"
      "LISTEN 0 1 0.0.0.0:0 0.0.0.0:* users:((\"x\",pid=1,fd=1))\n");
  assert(bindings.empty());
}

void TestPortsForPidKeepsListingOrder() {
  const auto bindings = ParseListeningSockets(kSsOutput);

  const auto nginx = PortsForPid(bindings, 1234);
  assert(nginx.size() == 2);
  assert(nginx[0].port == 80);
  assert(nginx[1].port == 443);

  assert(PortsForPid(bindings, 4242).empty());
}

void TestPortMapIndexesByPid() {
  const PortMap ports(ParseListeningSockets(kSsOutput));
  assert(ports.size() == 4);

  const auto& nginx = ports.PortsFor(1234);
  assert(nginx.size() == 2);
  assert(nginx[0] == 80);
  assert(nginx[1] == 443);

  assert(ports.PortsFor(5678).size() == 1);
  assert(ports.PortsFor(1).empty());

  const PortMap empty;
  assert(empty.size() == 0);
  assert(empty.PortsFor(1234).empty());
}

} // namespace

int main() {
  TestIsWebPort();
  TestParsesListenersWithOwners();
  TestOutOfRangePortsAreSkipped();
  TestPortsForPidKeepsListingOrder();
  TestPortMapIndexesByPid();

  std::cout << "hostreg_unit_port_mapper: pass\n";
  return 0;
}
