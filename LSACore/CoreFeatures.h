// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//
// DESCRIPTION:   Named switches for optional core behavior
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#include <string>

namespace lsa {
namespace features {

struct Flags {
   bool secondSavePathReachabilityCheck = true;
   bool diskSpaceCheck = false;
   // How to add a new core feature: see the comment in the .cpp file.
};

namespace internal {

extern Flags g_flags;

}

inline const Flags& flags() { return internal::g_flags; }

// Both throw CLSAError (LSAERR_NoSuchFeature) for an unknown name.
void enableFeature(const std::string& name, bool enable);
bool isFeatureEnabled(const std::string& name);

} // namespace features
} // namespace lsa
