// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_VERSION_H
#define MC_VERSION_H

/*
 * Version of the MicroCsms library (not related with the OCPP version)
 */
#define MC_VERSION "0.3.0"

/*
 * OCPP version and subprotocol which the server negotiates with the charge points
 */
#define MC_OCPP_VERSION "1.6"
#define MC_OCPP_SUBPROTOCOL "ocpp1.6"

#endif
