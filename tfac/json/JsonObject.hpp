/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TFAC_JSON_JSON_OBJECT_HPP
#define TFAC_JSON_JSON_OBJECT_HPP

#include "JsonPtr.hpp"

namespace tfac {

/**
 * A JsonPtr with an object (key-value pair) as it's root element.
 * This allows all sorts of member lookups.
 */
class JsonObject:
    public JsonPtr
{
public:
    TFAC_JSON_CONSTRUCTORS(JsonObject, JsonPtr)

    /**
     * Loads the JSON object from disk,
     * failing if the root is not an object.
     */
    Status
    load(const std::string &filename);

    /**
     * Loads the JSON object from an in-memory string,
     * failing if the root is not an object.
     */
    Status
    decode(const std::string &data);

protected:
    // Type helpers:
    bool   hasKey    (const char *key) const;
    Status hasString (const char *key) const;
    Status hasBoolean(const char *key) const;
    Status hasInteger(const char *key) const;

    // Read helpers:
    const char *getString (const char *key, const char *fallback) const;
    bool        getBoolean(const char *key, bool fallback) const;
    json_int_t  getInteger(const char *key, json_int_t fallback) const;

private:
    Status
    checkRoot();
};

// Helper macros for implementing JsonObject child classes.
// The `Valid` check passes for a missing key, but not a mistyped one:

#define TFAC_JSON_STRING(name, key, fallback) \
    const char *name() const                    { return getString(key, fallback); } \
    tfac::Status name##Ok() const               { return hasString(key); } \
    tfac::Status name##Valid() const            { return hasKey(key) ? hasString(key) : tfac::Status(); }

#define TFAC_JSON_BOOLEAN(name, key, fallback) \
    bool name() const                           { return getBoolean(key, fallback); } \
    tfac::Status name##Ok() const               { return hasBoolean(key); } \
    tfac::Status name##Valid() const            { return hasKey(key) ? hasBoolean(key) : tfac::Status(); }

#define TFAC_JSON_INTEGER(name, key, fallback) \
    json_int_t name() const                     { return getInteger(key, fallback); } \
    tfac::Status name##Ok() const               { return hasInteger(key); } \
    tfac::Status name##Valid() const            { return hasKey(key) ? hasInteger(key) : tfac::Status(); }

} // namespace tfac

#endif
