#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        LogLevel_Debug,
        LogLevel_Info,
        LogLevel_Warning,
        LogLevel_Error,
        LogLevel_None,
    } LogLevel;

#ifdef __cplusplus
}
#endif
