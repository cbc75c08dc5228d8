#pragma once

#include <ostream>



namespace classdec {



struct ClassFile;



// Writes a readable, indented listing of a decoded classfile. Constant pool
// indices print as #n, followed by the text that they refer to where the
// pool has it. Bad indices are printed as they are, never thrown.
void dump(std::ostream& out, const ClassFile& classfile);



} // namespace classdec
