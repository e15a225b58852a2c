#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>
#include <variant>

namespace equiv {

/**
 * @brief Thrown when a set is constructed without one of its required functions.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Thrown by user-supplied equality or hash functions to signal that they
 *        cannot process a value.
 *
 * Membership probes (contains, erase and the bulk operations built on them) treat
 * this as "no match" instead of propagating it.
 */
class IncompatibleElement : public std::runtime_error {
public:
    explicit IncompatibleElement(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Thrown when a cursor is advanced past its last element.
 */
class NoSuchElement : public std::out_of_range {
public:
    explicit NoSuchElement(const std::string& what) : std::out_of_range(what) {}
};

/**
 * @brief Run a probe and map recognized incompatible-input failures to false.
 *
 * Recognized failures are IncompatibleElement, std::bad_optional_access (an absent
 * sentinel was dereferenced), std::bad_variant_access and std::bad_cast (which
 * covers std::bad_any_cast). Every other exception propagates.
 *
 * @tparam Probe Callable returning something convertible to bool
 * @param probe The probe to run
 * @return The probe's result, or false if it failed with a recognized exception
 */
template<typename Probe>
bool probe_or_false(Probe&& probe) {
    try {
        return static_cast<bool>(std::forward<Probe>(probe)());
    } catch (const IncompatibleElement&) {
        return false;
    } catch (const std::bad_optional_access&) {
        return false;
    } catch (const std::bad_variant_access&) {
        return false;
    } catch (const std::bad_cast&) {
        return false;
    }
}

} // namespace equiv
