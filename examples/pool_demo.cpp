#include "cachekit/cachekit.hpp"

#include <cstdio>
#include <string>
#include <vector>

namespace {

struct Connection {
  int serial = 0;
  std::string endpoint;
};

}  // namespace

int main() {
  int next_serial = 0;
  cachekit::memory::Pool<Connection> pool(
      [&next_serial](const cachekit::api::CancellationToken&) {
        Connection c;
        c.serial = ++next_serial;
        c.endpoint = "db-" + std::to_string(c.serial);
        return c;
      },
      2);
  if (!pool.construction_status().ok()) {
    std::fprintf(stderr, "pool fill failed: %s\n", pool.construction_status().ToString().c_str());
    return 1;
  }

  typedef cachekit::memory::Pool<Connection>::PooledPtr Ticket;
  std::vector<Ticket> held;
  for (int i = 0; i < 3; ++i) {
    cachekit::api::Result<Ticket> got =
        pool.AcquirePooledValueAsync(
                cachekit::memory::PooledValueAcquisitionMode::kAvailableInstanceOrCreateNewOne)
            .get();
    if (!got.ok() || !got.value()) continue;
    std::printf("acquired %s\n", got.value()->Value().value()->endpoint.c_str());
    held.push_back(got.value());
  }
  std::printf("available=%zu total=%zu\n", pool.AvailableInstancesCount().value(),
              pool.TotalInstancesCount().value());

  if (held.size() < 2) {
    std::fprintf(stderr, "expected at least two tickets\n");
    return 1;
  }
  cachekit::api::Status released = pool.ReleasePooledValue(held[0]);
  std::printf("release: %s\n", released.ToString().c_str());
  cachekit::api::Result<Connection> detached = pool.DetachPooledValue(held[1]);
  if (detached.ok()) std::printf("detached %s\n", detached.value().endpoint.c_str());
  held.clear();

  std::printf("available=%zu total=%zu\n", pool.AvailableInstancesCount().value(),
              pool.TotalInstancesCount().value());

  cachekit::api::Status st = pool.DecreaseAvailablePoolSizeAsync(1).get();
  std::printf("shrink by one: %s\n", st.ToString().c_str());

  pool.Dispose();
  return 0;
}
