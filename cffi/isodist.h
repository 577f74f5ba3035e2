const char* isodist_strerror();

typedef void* IsotopeEnvelope;
IsotopeEnvelope envelope_new(double mono_offset, int n, double* intensities);
IsotopeEnvelope envelope_new_from_element(const char* element);
IsotopeEnvelope envelope_copy(IsotopeEnvelope);
void envelope_free(IsotopeEnvelope);
int envelope_add(IsotopeEnvelope, IsotopeEnvelope, double prune_level);
int envelope_add_packed(IsotopeEnvelope, int n, double* packed, double prune_level);
IsotopeEnvelope envelope_mult(IsotopeEnvelope, long n, double prune_level);
int envelope_size(IsotopeEnvelope);
double envelope_mono_offset(IsotopeEnvelope);
void envelope_intensities(IsotopeEnvelope, double*);

int averagine_formula(double molecule_mass, char* out, int out_size);
int mass_to_distribution(double molecule_mass, double prune_level, int max_peaks,
                         double* masses, double* intensities);
double mass_from_mz(double mono_mz, int charge);
