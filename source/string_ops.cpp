// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <dltypes/string_ops.h>

namespace dltypes {

std::string string_append_str(std::string s1, std::string_view s2) {
    s1.append(s2.data(), s2.size());
    return s1;
}

std::string string_append(std::string s1, const std::string& s2) {
    s1 += s2;
    return s1;
}

} // namespace dltypes
