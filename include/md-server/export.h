#ifndef MD_SERVER_EXPORT_H
#define MD_SERVER_EXPORT_H

#ifdef _WIN32
#ifdef md_server_core_EXPORTS
#define MD_SERVER_API __declspec(dllexport)
#else
#define MD_SERVER_API __declspec(dllimport)
#endif
#else
#define MD_SERVER_API
#endif

#endif // MD_SERVER_EXPORT_H
