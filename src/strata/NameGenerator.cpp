#include "strata/NameGenerator.hpp"

#include "fmt/format.h"

namespace strata {

NameGenerator::NameGenerator(): m_prefix("_"), m_counter(0) {}

NameGenerator::NameGenerator(std::string prefix): m_prefix(std::move(prefix)), m_counter(0) {}

std::string NameGenerator::next() {
    return fmt::format("{}{}", m_prefix, ++m_counter);
}

} // namespace strata
