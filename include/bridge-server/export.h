#ifndef BRIDGE_SERVER_EXPORT_H
#define BRIDGE_SERVER_EXPORT_H

#ifdef _WIN32
#ifdef bridge_server_core_EXPORTS
#define BRIDGE_SERVER_API __declspec(dllexport)
#else
#define BRIDGE_SERVER_API __declspec(dllimport)
#endif
#ifdef BRIDGE_MODULE_EXPORTS
#define BRIDGE_MODULE_API __declspec(dllexport)
#else
#define BRIDGE_MODULE_API
#endif
#else
#define BRIDGE_SERVER_API __attribute__((visibility("default")))
#define BRIDGE_MODULE_API __attribute__((visibility("default")))
#endif

#endif // BRIDGE_SERVER_EXPORT_H
