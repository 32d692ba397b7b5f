#pragma once

#include <string>

#include "script/script.h"

#include "common.hpp"

namespace ordguard::protection {

const size_t chunk_size = 520;
const bytevector ORD_TAG {'o', 'r', 'd'};
const opcodetype CONTENT_TAG {OP_0};
const bytevector CONTENT_TYPE_TAG {'\1'};

const std::string JSON_CONTENT_TYPE = "application/json;charset=utf-8";

CScript MakeInscriptionScript(const xonly_pubkey& pk, const std::string& content_type, const bytevector& data);

}
