#pragma once

#include <string>
#include <string_view>

namespace mediaflow::util {

// RFC4122 v4 UUID in canonical lowercase text form.
std::string GenerateUuid();

/*
  "<prefix>_<uuid>", or the bare uuid when prefix is empty.

  Session ids use "upl", tasks "task"; document ids are bare.
*/
std::string GenerateId(std::string_view prefix = {});

} // namespace mediaflow::util
