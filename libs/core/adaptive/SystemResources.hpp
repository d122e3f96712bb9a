#pragma once

#include <QString>
#include <cstddef>

// Process and machine memory readings. Each returns 0 when the platform
// refuses the query.
namespace SystemResources {

size_t residentMemoryBytes();
size_t totalPhysicalMemoryBytes();

QString formatMemorySize(size_t bytes);

} // namespace SystemResources
