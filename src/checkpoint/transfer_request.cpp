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

#include "checkpoint/transfer_request.h"

#include <sstream>
#include <stdexcept>

#include "common/logging.h"
#include "http/http_client.h"

namespace fsimage {

const char* TransferParams::GET_IMAGE = "getimage";
const char* TransferParams::GET_EDIT = "getedit";
const char* TransferParams::GET_EDIT_NEW = "geteditnew";
const char* TransferParams::PUT_IMAGE = "putimage";
const char* TransferParams::PORT = "port";
const char* TransferParams::MACHINE = "machine";
const char* TransferParams::TOKEN = "token";

const char* to_string(TransferIntent intent) {
    switch (intent) {
    case TransferIntent::FETCH_IMAGE:
        return "FETCH_IMAGE";
    case TransferIntent::FETCH_EDIT_LOG:
        return "FETCH_EDIT_LOG";
    case TransferIntent::FETCH_EDIT_LOG_NEW:
        return "FETCH_EDIT_LOG_NEW";
    case TransferIntent::PUSH_IMAGE:
        return "PUSH_IMAGE";
    }
    return "UNKNOWN";
}

Status TransferRequest::create(const ParamMap& params, std::unique_ptr<TransferRequest>* request) {
    std::unique_ptr<TransferRequest> req(new TransferRequest());
    int num_gets = 0;
    for (auto& it : params) {
        const std::string& key = it.first;
        const std::string& value = it.second;
        if (key == TransferParams::GET_IMAGE) {
            req->_is_get_image = true;
            ++num_gets;
        } else if (key == TransferParams::GET_EDIT) {
            req->_is_get_edit = true;
            ++num_gets;
        } else if (key == TransferParams::GET_EDIT_NEW) {
            req->_is_get_edit_new = true;
            ++num_gets;
        } else if (key == TransferParams::PUT_IMAGE) {
            req->_is_put_image = true;
        } else if (key == TransferParams::PORT) {
            size_t pos = 0;
            try {
                req->_remote_port = std::stoi(value, &pos);
            } catch (const std::exception& e) {
                LOG(WARNING) << "invalid argument. port:" << value;
                return Status::InvalidArgument("Convert port failed, " + std::string(e.what()));
            }
            if (pos != value.size()) {
                LOG(WARNING) << "invalid argument. port:" << value;
                return Status::InvalidArgument("invalid port: " + value);
            }
        } else if (key == TransferParams::MACHINE) {
            req->_remote_host = value;
        } else if (key == TransferParams::TOKEN) {
            req->_has_token = true;
            req->_token = CheckpointSignature(value);
        }
    }

    if (num_gets > 1 || (num_gets == 0 && !req->_is_put_image)) {
        std::stringstream ss;
        ss << "illegal image transfer request, " << num_gets
           << " fetch parameters, putimage=" << req->_is_put_image;
        LOG(WARNING) << ss.str();
        return Status::InvalidArgument(ss.str());
    }

    *request = std::move(req);
    return Status::OK();
}

TransferIntent TransferRequest::intent() const {
    if (_is_get_image) {
        return TransferIntent::FETCH_IMAGE;
    } else if (_is_get_edit) {
        return TransferIntent::FETCH_EDIT_LOG;
    } else if (_is_get_edit_new) {
        return TransferIntent::FETCH_EDIT_LOG_NEW;
    }
    return TransferIntent::PUSH_IMAGE;
}

Status TransferRequest::get_info_server(std::string* endpoint) const {
    if (_remote_host.empty() || _remote_port == 0) {
        return Status::InvalidArgument("machine and port of the image servlet are required");
    }
    std::stringstream ss;
    ss << _remote_host << ":" << _remote_port;
    *endpoint = ss.str();
    return Status::OK();
}

std::string TransferRequest::to_query_string() const {
    std::stringstream ss;
    switch (intent()) {
    case TransferIntent::FETCH_IMAGE:
        ss << TransferParams::GET_IMAGE << "=1";
        break;
    case TransferIntent::FETCH_EDIT_LOG:
        ss << TransferParams::GET_EDIT << "=1";
        break;
    case TransferIntent::FETCH_EDIT_LOG_NEW:
        ss << TransferParams::GET_EDIT_NEW << "=1";
        break;
    case TransferIntent::PUSH_IMAGE:
        break;
    }
    if (_is_put_image) {
        if (intent() != TransferIntent::PUSH_IMAGE) {
            ss << "&";
        }
        ss << TransferParams::PUT_IMAGE << "=1";
    }
    if (_remote_port != 0) {
        ss << "&" << TransferParams::PORT << "=" << _remote_port;
    }
    if (!_remote_host.empty()) {
        ss << "&" << TransferParams::MACHINE << "=" << HttpClient::escape(_remote_host);
    }
    if (_has_token) {
        ss << "&" << TransferParams::TOKEN << "=" << HttpClient::escape(_token.to_string());
    }
    return ss.str();
}

} // namespace fsimage
