#pragma once

// Boilerplate generators

#define PRIMUS_NON_COPYABLE_TYPE(type)                                                                                 \
    type(const type&) = delete;                                                                                        \
    type& operator=(const type&) = delete

#define PRIMUS_DEFAULT_MOVE_MEMBERS(type)                                                                              \
    type(type&&) = default;                                                                                            \
    type& operator=(type&&) = default
