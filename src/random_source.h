// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_COMB_RANDOM_SOURCE_H_INCLUDED
#define HEADER_MODERN_COMB_RANDOM_SOURCE_H_INCLUDED

#include <array>
#include <cstdint>


namespace mcomb::impl {

    /**
     * Returns a version 4 random UUID in RFC byte order
     *
     * The bytes come from the operating system entropy source.
     * Throws boost::uuids::entropy_error if it fails.
     */
    std::array<uint8_t, 16> get_random_bytes();
}

#endif
