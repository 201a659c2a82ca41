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

#include "CoreFeatures.h"

#include "Error.h"

#include <map>
#include <stdexcept>
#include <utility>

// Core features are process-wide switches read by the driver when a run is
// planned. A run reads the flags once, so changing a feature does not affect
// a run already in progress.
//
// To add a feature:
// - Add a bool to struct Flags with its default value.
// - Add an entry to featureMap() below. Names are CamelCase and must never
//   be removed once added (a removed feature can be made a no-op instead).
// - Read the flag with lsa::features::flags().

namespace lsa {
namespace features {

namespace internal {

Flags g_flags{};

}

namespace {

const auto& featureMap() {
   using GetFunc = bool(*)();
   using SetFunc = void(*)(bool);
   using internal::g_flags;
   static const std::map<std::string, std::pair<GetFunc, SetFunc>> map = {
      {
         "SecondSavePathReachabilityCheck", {
            [] { return g_flags.secondSavePathReachabilityCheck; },
            [](bool e) { g_flags.secondSavePathReachabilityCheck = e; }
            // When disabled, an unreachable secondary destination is only
            // discovered per frame, as warnings.
         }
      },
      {
         "DiskSpaceCheck", {
            [] { return g_flags.diskSpaceCheck; },
            [](bool e) { g_flags.diskSpaceCheck = e; }
         }
      },
   };
   return map;
}

}

void enableFeature(const std::string& name, bool enable) {
   try {
      featureMap().at(name).second(enable);
   } catch (const std::out_of_range&) {
      throw CLSAError("No such feature: " + name, LSAERR_NoSuchFeature);
   }
}

bool isFeatureEnabled(const std::string& name) {
   try {
      return featureMap().at(name).first();
   } catch (const std::out_of_range&) {
      throw CLSAError("No such feature: " + name, LSAERR_NoSuchFeature);
   }
}

} // namespace features
} // namespace lsa
