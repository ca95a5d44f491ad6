/*
* Copyright 2023 Man Group Operations Ltd.
* NO WARRANTY, EXPRESSED OR IMPLIED
*/

#pragma once

#define CHUNKPORT_MOVE_ONLY_DEFAULT(__T__) \
    __T__(__T__ && ) noexcept = default; \
    __T__& operator=(__T__ && )  noexcept = default; \
    __T__(const __T__ & ) = delete; \
    __T__& operator=(const __T__ & ) = delete;

#define CHUNKPORT_NO_MOVE_OR_COPY(__T__) \
    __T__(__T__ && ) noexcept = delete; \
    __T__& operator=(__T__ && )  noexcept = delete; \
    __T__(const __T__ & ) = delete; \
    __T__& operator=(const __T__ & ) = delete;

#define CHUNKPORT_NO_COPY(__T__) \
    __T__(const __T__ & ) = delete; \
    __T__& operator=(const __T__ & ) = delete;
