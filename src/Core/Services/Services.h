#pragma once
/**
 * @file Services.h
 * @brief Convenience include for all service interfaces.
 */
#include "IConfig.h"
#include "IIO.h"
#include "ILogger.h"
#include "ITime.h"
#include "ITransport.h"
