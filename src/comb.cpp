// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-comb/comb.h>

#include "random_source.h"

using namespace mcomb;

auto comb::generate() -> comb {
    auto random = impl::get_random_bytes();
    return encode(random, std::chrono::system_clock::now());
}
