#pragma once

int cmdRender(int argc, char * argv[]);
int cmdSplit(int argc, char * argv[]);
int cmdJoin(int argc, char * argv[]);
