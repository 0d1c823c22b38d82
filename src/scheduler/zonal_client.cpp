#include "scheduler/zonal_client.hpp"

namespace zonelb {
namespace scheduler {

template class ZonalClient<registry::StringBackend>;

} // namespace scheduler
} // namespace zonelb
