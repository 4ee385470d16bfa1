#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <source_location>
#include <string_view>
#include <typeinfo>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "error.hpp"
#include "file.hpp"
#include "format.hpp"

namespace scoredb {
    using namespace boost::ut;

    // Compares with operator== and reports both sides formatted with fmt on a mismatch.
    template<typename X, typename Y>
    bool expect_equal(const X &expected, const Y &actual, const std::source_location &loc=std::source_location::current())
    {
        const bool ok = expected == actual;
        expect(ok, loc) << fmt::format("expected: {} actual: {}", expected, actual);
        return ok;
    }

    // Expects action to throw E with a message that mentions fragment.
    template<typename E=error>
    bool expect_throw_msg(const std::function<void()> &action, const std::string_view fragment,
        const std::source_location &loc=std::source_location::current())
    {
        try {
            action();
        } catch (const E &ex) {
            const std::string_view msg { ex.what() };
            const bool ok = msg.find(fragment) != std::string_view::npos;
            expect(ok, loc) << fmt::format("'{}' does not mention '{}'", msg, fragment);
            return ok;
        }
        expect(false, loc) << fmt::format("no {} has been thrown", typeid(E).name());
        return false;
    }
}
