#ifndef H_S3ZIP_TYPES_V0
#define H_S3ZIP_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        S3ZipStatusCode_Success = 0,
        S3ZipStatusCode_InvalidArgument,
        S3ZipStatusCode_InvalidSettings,
        S3ZipStatusCode_IOError,
        S3ZipStatusCode_UploadAborted,
        S3ZipStatusCode_EmptyStream,
        S3ZipStatusCode_InternalError,
        S3ZipStatusCodeCount,
    } S3ZipStatusCode;

    typedef enum
    {
        S3ZipLogLevel_Debug = 0,
        S3ZipLogLevel_Info,
        S3ZipLogLevel_Warning,
        S3ZipLogLevel_Error,
        S3ZipLogLevel_None,
        S3ZipLogLevelCount
    } S3ZipLogLevel;

    typedef enum
    {
        S3ZipSessionState_Created = 0,
        S3ZipSessionState_Uploading,
        S3ZipSessionState_Completing,
        S3ZipSessionState_Completed,
        S3ZipSessionState_Aborted,
        S3ZipSessionStateCount
    } S3ZipSessionState;

    /**
     * @brief S3 settings for the destination bucket.
     * @details Credentials are read from the environment (AWS_ACCESS_KEY_ID,
     * AWS_SECRET_ACCESS_KEY, and optionally AWS_SESSION_TOKEN).
     */
    typedef struct
    {
        const char* endpoint;
        const char* bucket_name;
        const char* region;
    } S3ZipS3Settings;

    /**
     * @brief Retry settings for failed part uploads.
     * @details Zero values select the defaults.
     */
    typedef struct
    {
        uint32_t max_attempts;  /**< Attempts per part, including the first */
        uint32_t base_delay_ms; /**< Backoff before the first retry */
        uint32_t max_delay_ms;  /**< Upper bound on any single backoff */
    } S3ZipRetrySettings;
#ifdef __cplusplus
}
#endif

#endif // H_S3ZIP_TYPES_V0
