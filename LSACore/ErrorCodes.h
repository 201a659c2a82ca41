///////////////////////////////////////////////////////////////////////////////
// FILE:          ErrorCodes.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   List of error IDs
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#define LSAERR_OK                               0
#define LSAERR_GENERIC                          1 // unspecified error

// Configuration errors: always detected before any step runs.
#define LSAERR_ExceedsStageSpeedLimit           100
#define LSAERR_EmptyChannelOrder                101
#define LSAERR_ConflictingSpectralModes         102
#define LSAERR_InvalidExposure                  103
#define LSAERR_InvalidStageSpeed                104
#define LSAERR_MissingSavePath                  105
#define LSAERR_SavePathUnreachable              106
#define LSAERR_SecondSavePathUnreachable        107
#define LSAERR_InsufficientDiskSpace            108
#define LSAERR_EmptyPlan                        109
#define LSAERR_DuplicateChannel                 110
#define LSAERR_InvalidInterval                  111

// Hardware command errors: fatal to a running acquisition.
#define LSAERR_StageCommandFailed               200
#define LSAERR_CameraCommandFailed              201
#define LSAERR_FilterCommandFailed              202

// Save errors: primary is fatal, secondary is reported as a warning.
#define LSAERR_PrimarySaveFailed                300
#define LSAERR_SecondarySaveFailed              301

// API usage errors.
#define LSAERR_InvalidRunState                  400
#define LSAERR_UnknownRunHandle                 401
#define LSAERR_RunInProgress                    402
#define LSAERR_NoSuchFeature                    403
#define LSAERR_FileOpenFailed                   404
#define LSAERR_SaveQueueFull                    405
#define LSAERR_NullPointer                      406
