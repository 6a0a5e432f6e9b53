/*
   Copyright 2022 The Driftgate Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#ifndef DRIFTGATE_DECODING_ERROR_HPP_
#define DRIFTGATE_DECODING_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace driftgate::decoding {

//! Malformed binary payload: too short, truncated field, invalid tag or enum discriminant, trailing bytes.
class DecodeError : public std::runtime_error {
  public:
    explicit DecodeError(const std::string& what) : std::runtime_error{what} {}
};

} // namespace driftgate::decoding

#endif // DRIFTGATE_DECODING_ERROR_HPP_
