#pragma once

#include <functional>
#include <memory>
#include <type_traits>

// unique_ptr with a C style release function, e.g.
// RAII<CURL*>::create<void>(curl_easy_init(), curl_easy_cleanup)
template <typename Ref>
    requires(std::is_pointer_v<Ref>)
struct RAII {
    using Type = std::remove_pointer_t<Ref>;
    template <typename Ret>
    using Deleter = std::function<Ret(Ref)>;
    template <typename Ret>
    using Value = std::unique_ptr<Type, Deleter<Ret>>;

    template <typename Ret>
    [[nodiscard]] static auto create(Ref r, Deleter<Ret> deleter) {
        return Value<Ret>(r, deleter);
    }
};
