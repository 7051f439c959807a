#ifndef REVSCOPE_UTIL_ERRORS_H
#define REVSCOPE_UTIL_ERRORS_H

#include <revscope/revscope_export.h>

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace revscope {

    /**
     * Root of all errors raised by revscope itself.
     */
    struct REVSCOPE_EXPORT RevscopeError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * Misuse of the revision context: accessing the current revision with no scope open, unknown transactional
     * resources, querying without a version store.
     */
    struct REVSCOPE_EXPORT RevisionManagementError : RevscopeError {
        using RevscopeError::RevscopeError;
    };

    /**
     * Misuse of the registration API: double registration, unknown types, slug clashes.
     */
    struct REVSCOPE_EXPORT RegistrationError : RevscopeError {
        using RevscopeError::RevscopeError;
    };

    /**
     * A followed relation resolved to something that is not an entity, a list of entities or nothing.
     */
    struct REVSCOPE_EXPORT RelationshipError : RevscopeError {
        using RevscopeError::RevscopeError;
    };

    struct REVSCOPE_EXPORT SerializationError : RevscopeError {
        using RevscopeError::RevscopeError;
    };

    /**
     * Raised by entity implementations when a relation refers to an object that no longer exists.
     * Relationship following tolerates it.
     */
    struct REVSCOPE_EXPORT ObjectDoesNotExist : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    template<typename Error = RevscopeError, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - plain message, the source location is appended
    template<typename Error = RevscopeError>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format("{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(),
                                loc.function_name())};
    }

    // Overload (II) - the message is formatted from args, nothing is appended
    template<typename Error = RevscopeError, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace revscope

#endif // REVSCOPE_UTIL_ERRORS_H
