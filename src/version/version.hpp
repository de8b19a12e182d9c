#pragma once
#include <string>

// Manually define major/minor wigner versions
#define WIGNER_VERSION 1.0
#define WIGNER_MAJOR_VERSION 1
#define WIGNER_MINOR_VERSION 0

//==============================================================================
//! Information about the wigner code (version, compiler etc.).
/*! @details Defines the macros:
WIGNER_VERSION, WIGNER_MAJOR_VERSION, WIGNER_MINOR_VERSION
(defined in version.hpp).
Also, uses macros: GITBRANCH, GITREVISION, GITMODIFIED, CXXVERSION, COMPTIME
These should be set using compile flags (-D) on compilation.
*/
namespace version {

//! String with version info, including git branch/revision, and if any files
//! have been modified since the last commit
std::string version();

//! String with compilation info, including which compiler was used and the time
//! of compilation
std::string compiled();

//! String containing details (version numbers) of libraries (Boost, fmt)
std::string libraries();

} // namespace version
