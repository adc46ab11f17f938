#ifndef SRC_STRATA_NAME_GENERATOR_HPP_
#define SRC_STRATA_NAME_GENERATOR_HPP_

#include <atomic>
#include <cstdint>
#include <string>

namespace strata {

// Produces fresh variable names "_1", "_2", ... for renaming. One generator must serve a whole lowering run. The
// counter is atomic so concurrent runs may share a generator; runs that want separate sequences can use distinct
// prefixes instead. Source bindings must not begin with the prefix, see Validator::validatePrecompiled().
class NameGenerator {
public:
    NameGenerator();
    explicit NameGenerator(std::string prefix);
    ~NameGenerator() = default;

    NameGenerator(const NameGenerator&) = delete;
    NameGenerator& operator=(const NameGenerator&) = delete;

    std::string next();

    // Number of names handed out so far.
    uint64_t count() const { return m_counter.load(); }
    const std::string& prefix() const { return m_prefix; }

private:
    std::string m_prefix;
    std::atomic<uint64_t> m_counter;
};

} // namespace strata

#endif // SRC_STRATA_NAME_GENERATOR_HPP_
