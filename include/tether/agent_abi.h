#ifndef TETHER_AGENT_ABI_H
#define TETHER_AGENT_ABI_H

/*
 * C entry point exported by agent modules.
 *
 * A module implementing capability <name> exports
 *
 *     int tether_agent_<name>(const char *input_json, char **output_json);
 *
 * input_json is the UTF-8 invocation document {"capability": ..., "parameters": {...}}.
 * On return *output_json must be NULL or a malloc()-allocated, NUL-terminated JSON
 * document; the host releases it with free(). Zero means success. Any other value is a
 * handled failure and *output_json, when set, describes it.
 */

#ifdef __cplusplus
extern "C"
{
#endif

    typedef int (*tether_agent_entry_fn)(const char *input_json, char **output_json);

#define TETHER_AGENT_SYMBOL_PREFIX "tether_agent_"
#define TETHER_AGENT_LIBRARY_PREFIX "libtether_agent_"

#ifdef __cplusplus
}
#endif

#endif /* TETHER_AGENT_ABI_H */
