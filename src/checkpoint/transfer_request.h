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

#ifndef FSIMAGE_SRC_CHECKPOINT_TRANSFER_REQUEST_H
#define FSIMAGE_SRC_CHECKPOINT_TRANSFER_REQUEST_H

#include <map>
#include <memory>
#include <string>

#include "checkpoint/checkpoint_signature.h"
#include "common/status.h"

namespace fsimage {

enum class TransferIntent {
    FETCH_IMAGE,
    FETCH_EDIT_LOG,
    FETCH_EDIT_LOG_NEW,
    PUSH_IMAGE
};

const char* to_string(TransferIntent intent);

// Query parameters of an image servlet request, name to value.
typedef std::map<std::string, std::string> ParamMap;

// Wire names of the request parameters.
struct TransferParams {
    static const char* GET_IMAGE;
    static const char* GET_EDIT;
    static const char* GET_EDIT_NEW;
    static const char* PUT_IMAGE;
    static const char* PORT;
    static const char* MACHINE;
    static const char* TOKEN;
};

// A classified request to the image servlet.
//
// A request is valid when exactly one of getimage, getedit, geteditnew is
// present, or none of them is present and putimage is. Only the presence of
// those keys matters, their values are ignored. Unknown keys are ignored.
//
// Immutable once created.
class TransferRequest {
public:
    static Status create(const ParamMap& params, std::unique_ptr<TransferRequest>* request);

    bool is_get_image() const { return _is_get_image; }
    bool is_get_edit() const { return _is_get_edit; }
    bool is_get_edit_new() const { return _is_get_edit_new; }
    bool is_put_image() const { return _is_put_image; }

    // The fetch intent when one was requested, PUSH_IMAGE otherwise.
    TransferIntent intent() const;

    // Empty when the request carried no machine.
    const std::string& remote_host() const { return _remote_host; }
    // 0 when the request carried no port.
    int remote_port() const { return _remote_port; }

    bool has_token() const { return _has_token; }
    const CheckpointSignature& token() const { return _token; }

    // "host:port" of the peer whose image servlet serves the merged image.
    // InvalidArgument when the host or the port is unset.
    Status get_info_server(std::string* endpoint) const;

    // Render the request back into its query string form, values escaped.
    // Every flag the request carries is kept, so the result parses back
    // into an equal request.
    std::string to_query_string() const;

private:
    TransferRequest() {}

    bool _is_get_image = false;
    bool _is_get_edit = false;
    bool _is_get_edit_new = false;
    bool _is_put_image = false;
    std::string _remote_host;
    int _remote_port = 0;
    bool _has_token = false;
    CheckpointSignature _token;
};

} // namespace fsimage

#endif // FSIMAGE_SRC_CHECKPOINT_TRANSFER_REQUEST_H
