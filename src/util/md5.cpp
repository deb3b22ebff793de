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

#include "util/md5.h"

#include "common/logging.h"

namespace fsimage {

const size_t Md5Digest::DIGEST_LENGTH;

Md5Digest::Md5Digest() : _md5_ctx(EVP_MD_CTX_new()) {
    CHECK(_md5_ctx != nullptr) << "failed to allocate md5 context";
    CHECK_EQ(1, EVP_DigestInit_ex(_md5_ctx, EVP_md5(), nullptr));
}

Md5Digest::~Md5Digest() {
    EVP_MD_CTX_free(_md5_ctx);
}

void Md5Digest::update(const void* data, size_t length) {
    EVP_DigestUpdate(_md5_ctx, data, length);
}

void Md5Digest::digest() {
    unsigned char buf[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_DigestFinal_ex(_md5_ctx, buf, &len);
    DCHECK_EQ(DIGEST_LENGTH, len);

    _raw.assign(reinterpret_cast<const char*>(buf), len);

    static char dig_vec_lower[] = "0123456789abcdef";
    _hex.resize(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        _hex[i * 2] = dig_vec_lower[buf[i] >> 4];
        _hex[i * 2 + 1] = dig_vec_lower[buf[i] & 0x0F];
    }
}

} // namespace fsimage
