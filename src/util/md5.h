// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#ifndef FSIMAGE_SRC_UTIL_MD5_H
#define FSIMAGE_SRC_UTIL_MD5_H

#include <openssl/evp.h>

#include <string>

namespace fsimage {

// Streaming MD5 accumulator.
// Usage:
//   Md5Digest digest;
//   digest.update(buf1, len1);
//   digest.update(buf2, len2);
//   digest.digest();
//   digest.hex();
class Md5Digest {
public:
    static const size_t DIGEST_LENGTH = 16;

    Md5Digest();
    ~Md5Digest();

    void update(const void* data, size_t length);

    // Finalize the digest. update() must not be called afterwards.
    void digest();

    // 16 raw bytes, valid after digest()
    const std::string& raw() const { return _raw; }
    // lower-case hex form of raw(), valid after digest()
    const std::string& hex() const { return _hex; }

private:
    Md5Digest(const Md5Digest&) = delete;
    const Md5Digest& operator=(const Md5Digest&) = delete;

    EVP_MD_CTX* _md5_ctx;
    std::string _raw;
    std::string _hex;
};

} // namespace fsimage

#endif // FSIMAGE_SRC_UTIL_MD5_H
