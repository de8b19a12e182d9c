#include "version.hpp"
#include <boost/version.hpp>
#include <fmt/format.h>
#include <string>

// Macro translates constants to "strings"
#define XSTRING(s) STRING(s)
#define STRING(s) #s

// Constants refer to git revision info.
// These are passed in at compile time via -D flag
// If not set, the code will still work (these will just be blank)
// These are in the .cpp file, so we only need to re-build this file (and
// re-link) whenever we want updated git version info
#ifndef GITBRANCH
#define GITBRANCH
#endif
#ifndef GITREVISION
#define GITREVISION
#endif
#ifndef GITMODIFIED
#define GITMODIFIED
#endif
#ifndef CXXVERSION
#define CXXVERSION
#endif
#ifndef COMPTIME
#define COMPTIME
#endif

//==============================================================================
namespace version {

static const std::string git_branch = XSTRING(GITBRANCH);
static const std::string git_revision = XSTRING(GITREVISION);
static const std::string git_modified = XSTRING(GITMODIFIED);
static const std::string cxx_version = XSTRING(CXXVERSION);
static const std::string compiled_time = XSTRING(COMPTIME);
static const std::string wigner_version = XSTRING(WIGNER_VERSION);

std::string version() {
  return git_revision.empty() ?
             wigner_version :
         git_modified.empty() ?
             wigner_version + " [" + git_branch + "/" + git_revision + "]" :
             wigner_version + " [" + git_branch + "/" + git_revision + "]*\n" +
                 " *(Modified: " + git_modified + ")";
}

std::string compiled() { return cxx_version + " " + compiled_time; }

std::string libraries() {
  // BOOST_VERSION = major*100000 + minor*100 + patch
  // FMT_VERSION = major*10000 + minor*100 + patch
  return fmt::format("Boost v: {}.{}.{}\n"
                     "fmt v: {}.{}.{}",
                     BOOST_VERSION / 100000, BOOST_VERSION / 100 % 1000,
                     BOOST_VERSION % 100, FMT_VERSION / 10000,
                     FMT_VERSION / 100 % 100, FMT_VERSION % 100);
}

} // namespace version
