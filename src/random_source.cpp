// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "random_source.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/random_generator.hpp>

#include <algorithm>

namespace mcomb::impl {

    std::array<uint8_t, 16> get_random_bytes() {

        thread_local boost::uuids::random_generator gen;

        boost::uuids::uuid value = gen();
        static_assert(boost::uuids::uuid::static_size() == 16);

        std::array<uint8_t, 16> ret;
        std::copy(value.begin(), value.end(), ret.begin());
        return ret;
    }

}
