/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonObject.hpp"

namespace tfac {

Status
JsonObject::load(const std::string &filename)
{
    TFAC_CHECK(JsonPtr::load(filename));
    TFAC_CHECK(checkRoot());
    return Status();
}

Status
JsonObject::decode(const std::string &data)
{
    TFAC_CHECK(JsonPtr::decode(data));
    TFAC_CHECK(checkRoot());
    return Status();
}

Status
JsonObject::checkRoot()
{
    if (!json_is_object(root_))
    {
        reset();
        return TFAC_ERROR(TFAC_CC_JSONError, "JSON root is not an object");
    }
    return Status();
}

bool
JsonObject::hasKey(const char *key) const
{
    return json_object_get(root_, key);
}

#define IMPLEMENT_HAS(test) \
    json_t *value = json_object_get(root_, key); \
    if (!value) \
        return TFAC_ERROR(TFAC_CC_JSONError, "Missing JSON value for " + std::string(key)); \
    if (!(test)) \
        return TFAC_ERROR(TFAC_CC_JSONError, "Bad JSON value for " + std::string(key)); \
    return Status();

Status
JsonObject::hasString (const char *key) const
{
    IMPLEMENT_HAS(json_is_string(value))
}

Status
JsonObject::hasBoolean(const char *key) const
{
    IMPLEMENT_HAS(json_is_boolean(value))
}

Status
JsonObject::hasInteger(const char *key) const
{
    IMPLEMENT_HAS(json_is_integer(value))
}

#define IMPLEMENT_GET(type) \
    json_t *value = json_object_get(root_, key); \
    if (!value || !json_is_##type(value)) \
        return fallback; \
    return json_##type##_value(value);

const char *
JsonObject::getString(const char *key, const char *fallback) const
{
    IMPLEMENT_GET(string)
}

bool
JsonObject::getBoolean(const char *key, bool fallback) const
{
    IMPLEMENT_GET(boolean)
}

json_int_t
JsonObject::getInteger(const char *key, json_int_t fallback) const
{
    IMPLEMENT_GET(integer)
}

} // namespace tfac
