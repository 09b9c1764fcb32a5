#ifndef JDKI_VERSION_HPP
#define JDKI_VERSION_HPP

#include <string>

namespace jdki {

const std::string JDKI_VERSION_STRING = "1.0.0";
const int JDKI_VERSION_MAJOR = 1;
const int JDKI_VERSION_MINOR = 0;
const int JDKI_VERSION_PATCH = 0;

} // namespace jdki

#endif // JDKI_VERSION_HPP
