/**
 * @file parking_error.cpp
 * @brief 错误码名称
 */
#include "parking_error.h"

const char* parkingErrorName(ParkingErrorCode code) {
    switch (code) {
        case ParkingErrorCode::InvalidInput: return "InvalidInput";
        case ParkingErrorCode::LevelNotFound: return "LevelNotFound";
        case ParkingErrorCode::Full: return "Full";
        case ParkingErrorCode::NotFound: return "NotFound";
        case ParkingErrorCode::UnknownCriterion: return "UnknownCriterion";
        default: return "Unknown";
    }
}
