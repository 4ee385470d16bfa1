/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <scoredb/common/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace scoredb;
    try {
        return cli::run(argc, argv);
    } catch (const std::exception &ex) {
        logger::error("Terminating due to an exception: {}", ex.what());
        return 1;
    } catch (...) {
        logger::error("Terminating due to an unknown exception");
        return 2;
    }
}
