#include "registry/registry_snapshot.hpp"

namespace zonelb {
namespace registry {

template class RegistrySnapshot<StringBackend>;

} // namespace registry
} // namespace zonelb
