#undef required
#undef interface
#undef unreachable
